#include "core/ResponseHeaders.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace showgrab {
namespace core {

namespace {

std::string trimLine(const std::string& line) {
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

void ResponseHeaders::consume(const std::string& rawLine) {
    std::string line = trimLine(rawLine);
    if (line.compare(0, 5, "HTTP/") == 0) {
        // New response in the chain: forget what the previous one said
        contentLength_.reset();
        encoded_ = false;
        auto space = line.find(' ');
        statusCode_ = space == std::string::npos ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) {
        return;
    }
    std::string name = toLower(trimLine(line.substr(0, colon)));
    std::string value = trimLine(line.substr(colon + 1));

    if (name == "content-length") {
        if (!value.empty() && std::all_of(value.begin(), value.end(),
                                          [](unsigned char c) { return std::isdigit(c); })) {
            contentLength_ = std::strtoull(value.c_str(), nullptr, 10);
        }
    } else if (name == "content-encoding") {
        std::string encoding = toLower(value);
        encoded_ = !encoding.empty() && encoding != "identity";
    }
}

std::optional<std::uint64_t> ResponseHeaders::bodyLength() const {
    if (encoded_) {
        return std::nullopt;
    }
    return contentLength_;
}

} // namespace core
} // namespace showgrab
