#include "core/Errors.hpp"

namespace showgrab {
namespace core {

std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Parse: return "ParseError";
        case ErrorKind::Fetch: return "FetchError";
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::Range: return "RangeError";
        case ErrorKind::Conflict: return "ConflictError";
        case ErrorKind::Network: return "NetworkError";
        case ErrorKind::Filesystem: return "FilesystemError";
        case ErrorKind::Usage: return "UsageError";
        default: return "Unknown";
    }
}

} // namespace core
} // namespace showgrab
