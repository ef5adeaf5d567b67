#include "gossamer/time.hh"

#include <caf/timestamp.hpp>

namespace gossamer {

void convert(timespan s, fractional_seconds& secs) {
  secs = std::chrono::duration_cast<fractional_seconds>(s);
}

void convert(timespan s, double& secs) {
  secs = std::chrono::duration_cast<fractional_seconds>(s).count();
}

void convert(timespan s, std::string& str) {
  using std::to_string;
  struct unit {
    int64_t factor;
    const char* suffix;
  };
  static constexpr unit units[] = {
    {3'600'000'000'000, "h"}, {60'000'000'000, "min"}, {1'000'000'000, "s"},
    {1'000'000, "ms"},        {1'000, "us"},
  };
  auto count = s.count();
  if (count != 0) {
    for (const auto& [factor, suffix] : units) {
      if (count % factor == 0) {
        str = to_string(count / factor);
        str += suffix;
        return;
      }
    }
  }
  str = to_string(count);
  str += "ns";
}

void convert(wall_timestamp t, std::string& str) {
  str.clear();
  caf::append_timestamp_to_string(str, t);
}

bool convert(double secs, timespan& s) {
  s = std::chrono::duration_cast<timespan>(fractional_seconds{secs});
  return true;
}

timestamp now() {
  return std::chrono::time_point_cast<timespan>(clock::now());
}

wall_timestamp wall_now() {
  return std::chrono::time_point_cast<timespan>(wall_clock::now());
}

} // namespace gossamer
