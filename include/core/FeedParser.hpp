#pragma once

#include "core/ShowRecord.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <pugixml.hpp>

namespace showgrab {
namespace core {

class FeedParser {
public:
    // Placeholder used when an item's HTML description cannot be parsed
    static const char* const kUnparsableDescription;

    FeedParser() = default;
    ~FeedParser() = default;

    // Parse feed bytes into records, in document order.
    // Throws ParseError only if the document itself is unreadable.
    std::vector<ShowRecord> parse(const std::string& xml) const;

    // Channel title, or empty if the feed has none
    std::string parseChannelTitle(const std::string& xml) const;

    // RFC 822 date to seconds since epoch (UTC); 0 when unparseable
    static std::int64_t parsePubDate(const std::string& raw);

    // Trimmed text of the first <p> in an HTML fragment
    static std::string extractFirstParagraph(const std::string& html);

private:
    void loadDocument(pugi::xml_document& doc, const std::string& xml) const;
    ShowRecord parseItem(const pugi::xml_node& item) const;
    static std::uint64_t parseLength(const std::string& value);
};

} // namespace core
} // namespace showgrab
