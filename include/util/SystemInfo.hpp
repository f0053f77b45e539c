#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace wattrec::util {

// "<system> <release>", e.g. "Linux 6.8.0-45-generic" or "Darwin 23.4.0"
std::string os_label();

// Seconds since boot, if the platform reports it
std::optional<uint64_t> uptime_seconds();

// "3d 4h 5m 6s"; zero day/hour/minute parts are omitted
std::string format_uptime(uint64_t seconds);

// UTC "YYYY-MM-DD_HH-MM-SS"
std::string utc_timestamp(std::chrono::system_clock::time_point tp);

} // namespace wattrec::util
