#pragma once

#include "core/Config.hpp"
#include "core/DownloadSession.hpp"
#include "core/Events.hpp"
#include "core/FeedParser.hpp"
#include "core/HttpClient.hpp"
#include "core/ShowRecord.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace showgrab {
namespace core {

/**
 * Holds the current show list and the single download slot.
 *
 * All public methods are meant to be called from one controlling thread.
 * Feed fetches and downloads run on worker threads and report back through
 * an event channel; processEvents() drains it and calls the sink.
 */
class Orchestrator {
public:
    Orchestrator(Config config, std::shared_ptr<HttpClient> client, EventSink& sink);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Feed
    void loadShows(const std::string& source = "");
    bool isLoading() const { return fetchInFlight_.load(); }
    const ShowList& shows() const { return *shows_; }
    std::size_t showCount() const { return shows_->size(); }
    const std::string& channelTitle() const { return channelTitle_; }

    // Selection
    bool selectShow(int index);
    std::optional<std::size_t> selectedIndex() const { return selectedIndex_; }
    std::optional<ShowRecord> selectedShow() const;

    // Download slot
    std::string startDownload(const std::string& destinationDir = "");
    void cancelDownload();
    bool isDownloading() const;
    DownloadState downloadState() const;

    // Id of the most recent attempt; 0 before the first download
    std::uint64_t downloadId() const { return lastDownloadId_; }

    // Delivers queued notifications to the sink on the calling thread.
    // Waits up to `timeout` for the first one; returns how many were delivered.
    std::size_t processEvents(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    const Config& config() const { return config_; }

    // File name helpers
    static std::string sanitizeTitle(const std::string& title);
    static std::string extensionFromUrl(const std::string& url);
    static std::string deriveFileName(const std::string& title, const std::string& url);

private:
    void fetchShows(std::string source);
    bool dispatch(Event& event);
    void joinFetchWorker();

    Config config_;
    std::shared_ptr<HttpClient> client_;
    EventSink& sink_;
    std::shared_ptr<EventChannel> events_;
    FeedParser parser_;

    std::shared_ptr<const ShowList> shows_;
    std::string channelTitle_;
    std::optional<std::size_t> selectedIndex_;

    std::unique_ptr<DownloadSession> session_;
    DownloadState lastDownloadState_;
    std::uint64_t lastDownloadId_ = 0;

    std::atomic<bool> fetchInFlight_{false};
    std::thread fetchWorker_;
};

} // namespace core
} // namespace showgrab
