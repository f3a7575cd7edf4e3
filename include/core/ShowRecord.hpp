#pragma once

#include <cstdint>
#include <string>

namespace showgrab {
namespace core {

// One parsed feed item. Every field is defaulted by the parser.
struct ShowRecord {
    std::string title;
    std::string description;
    std::string link;              // Enclosure URL, empty when not downloadable
    std::string publishedRaw;
    std::int64_t publishedTimestamp = 0;   // Seconds since epoch, 0 if unparseable
    std::uint64_t lengthBytes = 0;

    bool isDownloadable() const { return !link.empty(); }
};

} // namespace core
} // namespace showgrab
