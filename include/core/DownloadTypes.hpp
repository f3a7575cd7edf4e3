#ifndef SHOWGRAB_CORE_DOWNLOAD_TYPES_HPP
#define SHOWGRAB_CORE_DOWNLOAD_TYPES_HPP

#include "core/Errors.hpp"
#include <cstdint>
#include <string>

namespace showgrab {
namespace core {

enum class DownloadState {
    Idle,
    InProgress,
    Completed,
    Canceled,
    Failed
};

std::string toString(DownloadState state);

inline bool isTerminal(DownloadState state) {
    return state == DownloadState::Completed ||
           state == DownloadState::Canceled ||
           state == DownloadState::Failed;
}

struct ProgressSnapshot {
    std::uint64_t bytesDownloaded = 0;
    std::uint64_t totalBytes = 0;      // 0 = unknown
    double rateBytesPerSec = 0.0;
    double etaSeconds = -1.0;          // -1 = unknown

    // Whole percent, or -1 when the total size is unknown
    int percent() const {
        if (totalBytes == 0) {
            return -1;
        }
        std::uint64_t value = bytesDownloaded >= totalBytes ? 100 : bytesDownloaded * 100 / totalBytes;
        return static_cast<int>(value);
    }
};

// Payload of the one terminal event a session publishes
struct DownloadOutcome {
    DownloadState state = DownloadState::Idle;
    ProgressSnapshot progress;
    ErrorKind errorKind = ErrorKind::None;
    std::string errorMessage;
    std::string destination;
    std::uint64_t downloadId = 0;   // Attempt that produced it
};

} // namespace core
} // namespace showgrab

#endif // SHOWGRAB_CORE_DOWNLOAD_TYPES_HPP
