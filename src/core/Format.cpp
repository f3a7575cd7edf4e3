#include "core/Format.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace showgrab {
namespace core {

std::string formatBytes(double bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    const std::size_t unitCount = sizeof(units) / sizeof(units[0]);

    double size = std::max(bytes, 0.0);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < unitCount) {
        size /= 1024.0;
        ++unit;
    }

    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return out.str();
}

std::string formatMegabytes(std::uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / (1024.0 * 1024.0);
    return out.str();
}

std::string formatDuration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) {
        return "--:--";
    }

    const double maxSeconds = 99 * 3600 + 59 * 60 + 59;
    long total = static_cast<long>(std::min(seconds, maxSeconds) + 0.5);
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    std::ostringstream out;
    if (hours > 0) {
        out << hours << ":" << std::setw(2) << std::setfill('0') << minutes
            << ":" << std::setw(2) << std::setfill('0') << secs;
    } else {
        out << minutes << ":" << std::setw(2) << std::setfill('0') << secs;
    }
    return out.str();
}

std::string shortDate(const std::string& raw) {
    std::istringstream in(raw);
    std::string token;
    std::string result;
    for (int i = 0; i < 4 && in >> token; ++i) {
        if (!result.empty()) {
            result += " ";
        }
        result += token;
    }
    return result;
}

} // namespace core
} // namespace showgrab
