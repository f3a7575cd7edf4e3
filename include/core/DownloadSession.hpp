#pragma once

#include "core/DownloadTypes.hpp"
#include "core/Events.hpp"
#include "core/HttpClient.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace showgrab {
namespace core {

/**
 * One streaming transfer of a media file to local storage.
 *
 * The transfer runs on its own worker thread. Every chunk written produces a
 * progress event on the channel, followed by exactly one Finished event. The
 * destination file is removed unless the transfer completes.
 */
class DownloadSession {
public:
    static constexpr std::size_t kChunkSize = 8192;

    DownloadSession(std::shared_ptr<HttpClient> client, std::shared_ptr<EventChannel> events,
                    std::uint64_t id = 0);
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    // Starts the worker. A session runs once; a second call throws UsageError.
    void start(const std::string& url, const std::string& destination);

    // Cooperative; observed at the next chunk boundary
    void cancel();

    // Blocks until the worker has published its terminal event
    void wait();

    std::uint64_t id() const { return id_; }
    DownloadState state() const { return state_.load(); }
    bool cancelRequested() const { return cancelRequested_.load(); }
    const std::string& url() const { return url_; }
    const std::string& destination() const { return destination_; }

private:
    class Transfer;

    void run();
    void publishProgress(const ProgressSnapshot& progress);
    void finish(DownloadState state, const ProgressSnapshot& progress,
                ErrorKind errorKind = ErrorKind::None, const std::string& errorMessage = "");
    bool removePartialFile(std::string& error) const;

    std::shared_ptr<HttpClient> client_;
    std::shared_ptr<EventChannel> events_;
    const std::uint64_t id_;
    std::string url_;
    std::string destination_;

    std::atomic<DownloadState> state_{DownloadState::Idle};
    std::atomic<bool> started_{false};
    std::atomic<bool> cancelRequested_{false};
    std::thread worker_;
};

} // namespace core
} // namespace showgrab
