#pragma once

#include "core/DownloadTypes.hpp"
#include "core/Errors.hpp"
#include "core/EventQueue.hpp"
#include "core/ShowRecord.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace showgrab {
namespace core {

using ShowList = std::vector<ShowRecord>;

// Result of one feed fetch. `shows` is null when the fetch failed.
struct FeedEvent {
    std::shared_ptr<const ShowList> shows;
    std::string channelTitle;
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
};

struct DownloadEvent {
    enum class Type { Progress, Finished };

    Type type = Type::Progress;
    std::uint64_t downloadId = 0;
    ProgressSnapshot progress;
    DownloadOutcome outcome;   // Only meaningful for Finished
};

using Event = std::variant<FeedEvent, DownloadEvent>;
using EventChannel = EventQueue<Event>;

/**
 * Caller-supplied receiver for everything the core reports. Called only from
 * the thread that runs Orchestrator::processEvents.
 *
 * Progress is delivered for the current download attempt only. Every attempt
 * gets its Finished call, tagged with DownloadOutcome::downloadId.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void onShowsLoaded(std::size_t count, const std::string& channelTitle) {
        (void)count;
        (void)channelTitle;
    }
    virtual void onFeedError(ErrorKind kind, const std::string& message) {
        (void)kind;
        (void)message;
    }

    virtual void onDownloadProgress(const ProgressSnapshot& progress) = 0;
    virtual void onDownloadFinished(const DownloadOutcome& outcome) = 0;
};

} // namespace core
} // namespace showgrab
