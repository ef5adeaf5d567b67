#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <ratio>
#include <string>

namespace gossamer {

/// A fractional timestamp represented in IEEE754 double-precision floating
/// point.
using fractional_seconds = std::chrono::duration<double>;

/// A duration with nanosecond precision.
using timespan = std::chrono::duration<int64_t, std::nano>;

/// The monotonic clock for all deadlines. Deadlines never jump when the
/// system time changes.
using clock = std::chrono::steady_clock;

/// A point in time on the monotonic clock.
using timestamp = std::chrono::time_point<clock, timespan>;

/// The clock for user-facing timestamps such as log events.
using wall_clock = std::chrono::system_clock;

/// A point in time anchored at the UNIX epoch: January 1, 1970.
using wall_timestamp = std::chrono::time_point<wall_clock, timespan>;

/// Constant representing an infinite amount of time.
static constexpr auto infinite = timespan{std::numeric_limits<int64_t>::max()};

/// @relates timespan
void convert(timespan s, fractional_seconds& secs);

/// @relates timespan
void convert(timespan s, double& secs);

/// Prints `s` using the largest unit that represents it exactly, e.g., "10s",
/// "250ms" or "42ns".
/// @relates timespan
void convert(timespan s, std::string& str);

/// @relates wall_timestamp
void convert(wall_timestamp t, std::string& str);

/// @relates timespan
bool convert(double secs, timespan& s);

/// @returns the current point in time on the monotonic clock.
timestamp now();

/// @returns the current wall clock time.
wall_timestamp wall_now();

/// @relates timespan
inline std::string to_string(const timespan& s) {
  std::string x;
  convert(s, x);
  return x;
}

/// @relates wall_timestamp
inline std::string to_string(const wall_timestamp& t) {
  std::string x;
  convert(t, x);
  return x;
}

/// @relates timespan
inline timespan to_timespan(double secs) {
  fractional_seconds tmp{secs};
  return std::chrono::duration_cast<timespan>(tmp);
}

} // namespace gossamer
