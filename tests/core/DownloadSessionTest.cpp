#include "core/DownloadSession.hpp"
#include "core/Errors.hpp"
#include "FakeHttpClient.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace showgrab::core;
using showgrab::testing::FakeHttpClient;
using showgrab::testing::Gate;

namespace fs = std::filesystem;

namespace {

class DownloadSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("showgrab_session_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir_);
        client_ = std::make_shared<FakeHttpClient>();
        events_ = std::make_shared<EventChannel>();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string destination(const std::string& name = "episode.mp4") const {
        return (dir_ / name).string();
    }

    // Drains everything the session published
    void collect() {
        while (auto event = events_->tryPop()) {
            auto& download = std::get<DownloadEvent>(*event);
            if (download.type == DownloadEvent::Type::Progress) {
                progress_.push_back(download.progress);
            } else {
                finished_.push_back(download.outcome);
            }
        }
    }

    static std::string makeBody(std::size_t size) {
        std::string body(size, '\0');
        for (std::size_t i = 0; i < size; ++i) {
            body[i] = static_cast<char>('a' + i % 26);
        }
        return body;
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path dir_;
    std::shared_ptr<FakeHttpClient> client_;
    std::shared_ptr<EventChannel> events_;
    std::vector<ProgressSnapshot> progress_;
    std::vector<DownloadOutcome> finished_;
};

} // namespace

TEST_F(DownloadSessionTest, CompletesAndWritesBodyVerbatim) {
    client_->body = makeBody(50000);

    DownloadSession session(client_, events_);
    EXPECT_EQ(session.state(), DownloadState::Idle);
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    EXPECT_EQ(session.state(), DownloadState::Completed);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Completed);
    EXPECT_EQ(finished_[0].errorKind, ErrorKind::None);
    EXPECT_EQ(finished_[0].destination, destination());
    EXPECT_EQ(finished_[0].progress.bytesDownloaded, 50000u);
    EXPECT_EQ(finished_[0].progress.totalBytes, 50000u);

    EXPECT_EQ(readFile(destination()), client_->body);
    EXPECT_EQ(fs::file_size(destination()), finished_[0].progress.bytesDownloaded);
    EXPECT_EQ(client_->lastUrl, "http://x/a.mp4");
}

TEST_F(DownloadSessionTest, EventsCarryTheSessionId) {
    client_->body = makeBody(10000);

    DownloadSession session(client_, events_, 7);
    EXPECT_EQ(session.id(), 7u);
    session.start("http://x/a.mp4", destination());
    session.wait();

    std::size_t seen = 0;
    while (auto event = events_->tryPop()) {
        const auto& download = std::get<DownloadEvent>(*event);
        EXPECT_EQ(download.downloadId, 7u);
        if (download.type == DownloadEvent::Type::Finished) {
            EXPECT_EQ(download.outcome.downloadId, 7u);
        }
        ++seen;
    }
    EXPECT_EQ(seen, 3u);
}

TEST_F(DownloadSessionTest, ProgressIsChunkedAndMonotonic) {
    client_->body = makeBody(50000);
    client_->pieceSize = 16384;

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    // 50000 bytes in chunks of at most 8192
    ASSERT_EQ(progress_.size(), 7u);
    std::uint64_t previousBytes = 0;
    int previousPercent = 0;
    for (const auto& snapshot : progress_) {
        EXPECT_GT(snapshot.bytesDownloaded, previousBytes);
        EXPECT_LE(snapshot.bytesDownloaded - previousBytes, DownloadSession::kChunkSize);
        EXPECT_GE(snapshot.percent(), previousPercent);
        EXPECT_GE(snapshot.rateBytesPerSec, 0.0);
        EXPECT_GE(snapshot.etaSeconds, 0.0);
        previousBytes = snapshot.bytesDownloaded;
        previousPercent = snapshot.percent();
    }
    EXPECT_EQ(progress_.back().percent(), 100);
    EXPECT_EQ(progress_.back().etaSeconds, 0.0);
}

TEST_F(DownloadSessionTest, UnknownLengthReportsUnknownEta) {
    client_->body = makeBody(20000);
    client_->sendContentLength = false;

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    ASSERT_FALSE(progress_.empty());
    for (const auto& snapshot : progress_) {
        EXPECT_EQ(snapshot.totalBytes, 0u);
        EXPECT_EQ(snapshot.etaSeconds, -1.0);
        EXPECT_EQ(snapshot.percent(), -1);
    }
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Completed);
    EXPECT_EQ(fs::file_size(destination()), 20000u);
}

TEST_F(DownloadSessionTest, CancelMidStreamRemovesFile) {
    client_->body = makeBody(100000);
    client_->pieceSize = 8192;

    DownloadSession session(client_, events_);
    client_->beforePiece = [&session](std::size_t piece) {
        if (piece == 3) {
            session.cancel();
        }
    };
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    EXPECT_EQ(session.state(), DownloadState::Canceled);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Canceled);
    EXPECT_EQ(finished_[0].errorKind, ErrorKind::None);
    EXPECT_EQ(finished_[0].progress.bytesDownloaded, 3u * 8192u);
    EXPECT_EQ(progress_.size(), 3u);
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(DownloadSessionTest, CancelIsObservedWithinOneChunk) {
    client_->body = makeBody(100000);
    client_->pieceSize = 100000;

    DownloadSession session(client_, events_);
    Gate gate;
    client_->beforePiece = [&gate](std::size_t) { gate.wait(); };
    session.start("http://x/a.mp4", destination());

    gate.waitUntilReached();
    session.cancel();
    session.cancel();
    gate.open();
    session.wait();
    collect();

    EXPECT_TRUE(progress_.empty());
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Canceled);
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(DownloadSessionTest, CancelBeforeStartNeverConnects) {
    client_->body = makeBody(1000);

    DownloadSession session(client_, events_);
    session.cancel();
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    EXPECT_EQ(client_->streamCalls.load(), 0);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Canceled);
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(DownloadSessionTest, NetworkFailureFailsAndCleansUp) {
    client_->body = makeBody(50000);
    client_->pieceSize = 8192;
    client_->failAfterPieces = 2;

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    EXPECT_EQ(session.state(), DownloadState::Failed);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Failed);
    EXPECT_EQ(finished_[0].errorKind, ErrorKind::Network);
    EXPECT_EQ(finished_[0].errorMessage, "Connection reset by peer");
    EXPECT_EQ(progress_.size(), 2u);
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(DownloadSessionTest, ShortBodyIsATransportFailure) {
    client_->body = makeBody(1000);
    client_->advertisedLength = 5000;

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Failed);
    EXPECT_EQ(finished_[0].errorKind, ErrorKind::Network);
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(DownloadSessionTest, UnwritableDestinationIsFilesystemError) {
    client_->body = makeBody(1000);

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", (dir_ / "missing" / "episode.mp4").string());
    session.wait();
    collect();

    EXPECT_EQ(client_->streamCalls.load(), 0);
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Failed);
    EXPECT_EQ(finished_[0].errorKind, ErrorKind::Filesystem);
}

TEST_F(DownloadSessionTest, SecondStartIsRejected) {
    client_->body = makeBody(1000);

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", destination());
    EXPECT_THROW(session.start("http://x/a.mp4", destination("other.mp4")), UsageError);
    session.wait();
    EXPECT_THROW(session.start("http://x/a.mp4", destination("other.mp4")), UsageError);
    collect();

    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Completed);
    EXPECT_FALSE(fs::exists(destination("other.mp4")));
}

TEST_F(DownloadSessionTest, EmptyBodyCompletes) {
    client_->body.clear();

    DownloadSession session(client_, events_);
    session.start("http://x/a.mp4", destination());
    session.wait();
    collect();

    EXPECT_TRUE(progress_.empty());
    ASSERT_EQ(finished_.size(), 1u);
    EXPECT_EQ(finished_[0].state, DownloadState::Completed);
    EXPECT_EQ(fs::file_size(destination()), 0u);
}
