#include "gossamer/event.hh"

#include <iterator>

namespace gossamer {

namespace {

constexpr std::string_view severity_names[] = {
  "critical", "error", "warning", "info", "verbose", "debug",
};

} // namespace

std::string_view enum_str(event::severity_level level) noexcept {
  auto index = static_cast<size_t>(level);
  if (index < std::size(severity_names))
    return severity_names[index];
  return "???";
}

bool convert(std::string_view str, event::severity_level& level) noexcept {
  for (size_t index = 0; index < std::size(severity_names); ++index) {
    if (severity_names[index] == str) {
      level = static_cast<event::severity_level>(index);
      return true;
    }
  }
  return false;
}

std::string_view enum_str(event::component_type component) noexcept {
  using ct = event::component_type;
  switch (component) {
    case ct::multiplexer:
      return "multiplexer";
    case ct::dialer:
      return "dialer";
    case ct::timers:
      return "timers";
    case ct::framing:
      return "framing";
    case ct::transport:
      return "transport";
    case ct::app:
      return "app";
  }
  return "???";
}

} // namespace gossamer
