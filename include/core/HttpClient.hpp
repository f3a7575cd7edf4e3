#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace showgrab {
namespace core {

// Receives a streamed response body
class StreamHandler {
public:
    virtual ~StreamHandler() = default;

    // Called when the final response carries a content-length header
    virtual void onContentLength(std::uint64_t totalBytes) = 0;

    // Called for each body piece; return false to abort the transfer
    virtual bool onData(const char* data, std::size_t size) = 0;
};

/**
 * Network capability used by the feed fetch and the download session.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Fetch a whole document. Throws FetchError.
    virtual std::string get(const std::string& url) = 0;

    // Stream a response body into the handler. Returns normally at end of
    // stream or when the handler aborts; throws NetworkError on failure.
    virtual void stream(const std::string& url, StreamHandler& handler) = 0;
};

class CprHttpClient : public HttpClient {
public:
    CprHttpClient();
    ~CprHttpClient() override = default;

    std::string get(const std::string& url) override;
    void stream(const std::string& url, StreamHandler& handler) override;

    void setUserAgent(const std::string& userAgent) { userAgent_ = userAgent; }
    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

    // Trimmed, normalized http(s) URL, or empty if the URL is not usable
    static std::string cleanAndValidateUrl(const std::string& url);

private:
    std::string userAgent_;
    std::chrono::milliseconds timeout_;
};

} // namespace core
} // namespace showgrab
