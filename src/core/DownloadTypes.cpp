#include "core/DownloadTypes.hpp"

namespace showgrab {
namespace core {

std::string toString(DownloadState state) {
    switch (state) {
        case DownloadState::Idle: return "Idle";
        case DownloadState::InProgress: return "InProgress";
        case DownloadState::Completed: return "Completed";
        case DownloadState::Canceled: return "Canceled";
        case DownloadState::Failed: return "Failed";
        default: return "Unknown";
    }
}

} // namespace core
} // namespace showgrab
