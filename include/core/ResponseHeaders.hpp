#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace showgrab {
namespace core {

/**
 * Status and body length gathered from raw header lines. A redirect chain
 * produces several header blocks; each status line starts a fresh one.
 */
class ResponseHeaders {
public:
    void consume(const std::string& rawLine);

    long statusCode() const { return statusCode_; }

    // Length of the body as it will be delivered, if the server stated it.
    // A content-encoded body is decoded on the way in, so its length is unknown.
    std::optional<std::uint64_t> bodyLength() const;

private:
    long statusCode_ = 0;
    std::optional<std::uint64_t> contentLength_;
    bool encoded_ = false;
};

} // namespace core
} // namespace showgrab
