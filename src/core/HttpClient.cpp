#include "core/HttpClient.hpp"
#include "core/Errors.hpp"
#include "core/ResponseHeaders.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <cpr/cpr.h>
#include <ada.h>

namespace showgrab {
namespace core {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trimLine(const std::string& line) {
    auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

} // namespace

CprHttpClient::CprHttpClient()
    : userAgent_("Mozilla/5.0 (compatible; showgrab/1.0)"), timeout_(30000) {
}

std::string CprHttpClient::cleanAndValidateUrl(const std::string& url) {
    std::string cleaned = trimLine(url);
    if (cleaned.empty()) {
        return "";
    }

    auto parsed_url = ada::parse<ada::url>(cleaned);
    if (!parsed_url) {
        return "";
    }

    if (parsed_url->get_protocol() != "http:" && parsed_url->get_protocol() != "https:") {
        return "";
    }

    return parsed_url->get_href();
}

std::string CprHttpClient::get(const std::string& url) {
    std::string cleaned_url = cleanAndValidateUrl(url);
    if (cleaned_url.empty()) {
        throw FetchError("Invalid feed URL: " + url);
    }

    auto response = cpr::Get(
        cpr::Url{cleaned_url},
        cpr::Header{
            {"User-Agent", userAgent_},
            {"Accept", "application/rss+xml, application/xml, text/xml"}
        },
        cpr::Timeout{timeout_},
        cpr::Redirect{50L},
        cpr::VerifySsl{true}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        throw FetchError("Failed to fetch feed: " + response.error.message);
    }

    if (response.status_code != 200) {
        std::stringstream err;
        err << "Failed to fetch feed: HTTP " << response.status_code;
        if (!response.reason.empty()) {
            err << " " << response.reason;
        }
        throw FetchError(err.str());
    }

    if (response.text.empty()) {
        throw FetchError("Empty response received from feed URL");
    }

    auto content_type_it = response.header.find("content-type");
    if (content_type_it != response.header.end()) {
        std::string type = toLower(content_type_it->second);
        if (type.find("xml") == std::string::npos &&
            type.find("rss") == std::string::npos &&
            type.find("atom") == std::string::npos) {
            std::cerr << "Warning: Unexpected feed content type: " << type << std::endl;
        }
    }

    return response.text;
}

void CprHttpClient::stream(const std::string& url, StreamHandler& handler) {
    std::string cleaned_url = cleanAndValidateUrl(url);
    if (cleaned_url.empty()) {
        throw NetworkError("Invalid download URL: " + url);
    }

    ResponseHeaders headers;
    bool lengthReported = false;
    bool abortedByHandler = false;

    cpr::Session session;
    session.SetUrl(cpr::Url{cleaned_url});
    session.SetHeader(cpr::Header{
        {"User-Agent", userAgent_},
        {"Accept", "*/*"}
    });
    session.SetConnectTimeout(cpr::ConnectTimeout{timeout_});
    session.SetRedirect(cpr::Redirect{50L});
    session.SetVerifySsl(cpr::VerifySsl{true});
    // Media is stored as sent; content-length then matches the bytes written
    session.SetAcceptEncoding(cpr::AcceptEncoding{cpr::AcceptEncodingMethods::identity});

    session.SetHeaderCallback(cpr::HeaderCallback{[&headers](auto header, intptr_t) {
        headers.consume(std::string(header));
        return true;
    }});

    session.SetWriteCallback(cpr::WriteCallback{[&](auto data, intptr_t) {
        if (headers.statusCode() >= 400) {
            // Error page body, not media
            return false;
        }
        if (!lengthReported) {
            lengthReported = true;
            if (std::optional<std::uint64_t> length = headers.bodyLength()) {
                handler.onContentLength(*length);
            }
        }
        if (!handler.onData(data.data(), data.size())) {
            abortedByHandler = true;
            return false;
        }
        return true;
    }});

    cpr::Response response = session.Get();

    long status = headers.statusCode() != 0 ? headers.statusCode() : response.status_code;
    if (status >= 400) {
        std::stringstream err;
        err << "Download failed: HTTP " << status;
        if (!response.reason.empty()) {
            err << " " << response.reason;
        }
        throw NetworkError(err.str());
    }

    if (abortedByHandler) {
        return;
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        throw NetworkError("Download failed: " + response.error.message);
    }
}

} // namespace core
} // namespace showgrab
