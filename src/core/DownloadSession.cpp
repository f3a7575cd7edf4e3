#include "core/DownloadSession.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace showgrab {
namespace core {

namespace {

const double kMinElapsedSeconds = 1e-6;

} // namespace

// Writes body chunks to the destination and keeps the running snapshot
class DownloadSession::Transfer : public StreamHandler {
public:
    Transfer(DownloadSession& session, std::ofstream& out)
        : session_(session), out_(out), startTime_(std::chrono::steady_clock::now()) {}

    void onContentLength(std::uint64_t totalBytes) override {
        snapshot_.totalBytes = totalBytes;
    }

    bool onData(const char* data, std::size_t size) override {
        std::size_t offset = 0;
        do {
            if (session_.cancelRequested()) {
                canceled_ = true;
                return false;
            }
            if (size == 0) {
                return true;
            }

            std::size_t chunk = std::min(kChunkSize, size - offset);
            out_.write(data + offset, static_cast<std::streamsize>(chunk));
            if (!out_) {
                writeFailed_ = true;
                return false;
            }
            offset += chunk;
            snapshot_.bytesDownloaded += chunk;
            updateRates();
            session_.publishProgress(snapshot_);
        } while (offset < size);

        return true;
    }

    const ProgressSnapshot& snapshot() const { return snapshot_; }
    bool canceled() const { return canceled_; }
    bool writeFailed() const { return writeFailed_; }

private:
    void updateRates() {
        std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime_;
        double seconds = std::max(elapsed.count(), kMinElapsedSeconds);
        snapshot_.rateBytesPerSec = static_cast<double>(snapshot_.bytesDownloaded) / seconds;

        if (snapshot_.totalBytes > 0 && snapshot_.rateBytesPerSec > 0.0) {
            std::uint64_t remaining = snapshot_.totalBytes > snapshot_.bytesDownloaded
                ? snapshot_.totalBytes - snapshot_.bytesDownloaded : 0;
            snapshot_.etaSeconds = static_cast<double>(remaining) / snapshot_.rateBytesPerSec;
        } else {
            snapshot_.etaSeconds = -1.0;
        }
    }

    DownloadSession& session_;
    std::ofstream& out_;
    std::chrono::steady_clock::time_point startTime_;
    ProgressSnapshot snapshot_;
    bool canceled_ = false;
    bool writeFailed_ = false;
};

DownloadSession::DownloadSession(std::shared_ptr<HttpClient> client, std::shared_ptr<EventChannel> events,
                                 std::uint64_t id)
    : client_(std::move(client)), events_(std::move(events)), id_(id) {
    if (!client_ || !events_) {
        throw UsageError("DownloadSession requires an HTTP client and an event channel");
    }
}

DownloadSession::~DownloadSession() {
    cancel();
    wait();
}

void DownloadSession::start(const std::string& url, const std::string& destination) {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        throw UsageError("Download session already started; create a new session for another attempt");
    }

    url_ = url;
    destination_ = destination;
    state_ = DownloadState::InProgress;
    worker_ = std::thread(&DownloadSession::run, this);
}

void DownloadSession::cancel() {
    cancelRequested_ = true;
}

void DownloadSession::wait() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void DownloadSession::run() {
    // Canceled before the worker got going: no connection, no file
    if (cancelRequested()) {
        finish(DownloadState::Canceled, ProgressSnapshot{});
        return;
    }

    std::ofstream out(destination_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        finish(DownloadState::Failed, ProgressSnapshot{}, ErrorKind::Filesystem,
               "Cannot open destination file: " + destination_);
        return;
    }

    Transfer transfer(*this, out);
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;

    try {
        client_->stream(url_, transfer);
    } catch (const Error& e) {
        errorKind = e.kind();
        errorMessage = e.what();
    } catch (const std::exception& e) {
        errorKind = ErrorKind::Network;
        errorMessage = e.what();
    }

    bool wasGood = static_cast<bool>(out);
    out.close();
    bool closedCleanly = wasGood && !out.fail();

    const ProgressSnapshot& progress = transfer.snapshot();

    if (transfer.canceled()) {
        std::string cleanupError;
        if (!removePartialFile(cleanupError)) {
            finish(DownloadState::Canceled, progress, ErrorKind::Filesystem, cleanupError);
        } else {
            finish(DownloadState::Canceled, progress);
        }
        return;
    }

    if (transfer.writeFailed()) {
        errorKind = ErrorKind::Filesystem;
        errorMessage = "Failed writing to " + destination_;
    } else if (errorKind == ErrorKind::None && !closedCleanly) {
        errorKind = ErrorKind::Filesystem;
        errorMessage = "Failed to close " + destination_;
    } else if (errorKind == ErrorKind::None && progress.totalBytes > 0 &&
               progress.bytesDownloaded != progress.totalBytes) {
        std::stringstream err;
        err << "Transfer ended after " << progress.bytesDownloaded << " of "
            << progress.totalBytes << " bytes";
        errorKind = ErrorKind::Network;
        errorMessage = err.str();
    }

    if (errorKind != ErrorKind::None) {
        std::string cleanupError;
        if (!removePartialFile(cleanupError)) {
            std::cerr << "Warning: " << cleanupError << std::endl;
        }
        finish(DownloadState::Failed, progress, errorKind, errorMessage);
        return;
    }

    finish(DownloadState::Completed, progress);
}

void DownloadSession::publishProgress(const ProgressSnapshot& progress) {
    DownloadEvent event;
    event.type = DownloadEvent::Type::Progress;
    event.downloadId = id_;
    event.progress = progress;
    events_->push(Event{std::move(event)});
}

void DownloadSession::finish(DownloadState state, const ProgressSnapshot& progress,
                             ErrorKind errorKind, const std::string& errorMessage) {
    DownloadEvent event;
    event.type = DownloadEvent::Type::Finished;
    event.downloadId = id_;
    event.progress = progress;
    event.outcome.state = state;
    event.outcome.progress = progress;
    event.outcome.errorKind = errorKind;
    event.outcome.errorMessage = errorMessage;
    event.outcome.destination = destination_;
    event.outcome.downloadId = id_;

    state_ = state;
    events_->push(Event{std::move(event)});
}

bool DownloadSession::removePartialFile(std::string& error) const {
    std::error_code ec;
    fs::remove(destination_, ec);
    if (ec) {
        error = "Could not remove partial file " + destination_ + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace core
} // namespace showgrab
