#pragma once

#include <cstdint>
#include <string>

namespace showgrab {
namespace core {

// "12.34 MB" style, 1024 steps, capped at TB
std::string formatBytes(double bytes);

// Size column value in megabytes with two decimals
std::string formatMegabytes(std::uint64_t bytes);

// "M:SS" or "H:MM:SS", capped at 99:59:59; "--:--" when unknown
std::string formatDuration(double seconds);

// First four whitespace-separated tokens of a raw feed date
std::string shortDate(const std::string& raw);

} // namespace core
} // namespace showgrab
