#include "gossamer/logger.hh"

#include "gossamer/time.hh"

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

#include <caf/term.hpp>

namespace gossamer {

namespace {

event_observer_ptr global_observer;

caf::term color_for(event::severity_level level) {
  switch (level) {
    case event::severity_level::critical:
    case event::severity_level::error:
      return caf::term::red;
    case event::severity_level::warning:
      return caf::term::yellow;
    case event::severity_level::info:
      return caf::term::green;
    default:
      return caf::term::reset;
  }
}

/// Prints accepted events to `std::cerr`, one line per event.
class console_logger : public event_observer {
public:
  console_logger(event::severity_level severity, event::component_mask mask)
    : severity_(severity), mask_(mask) {
    // nop
  }

  void observe(event_ptr what) override {
    auto ts = to_string(what->timestamp);
    std::lock_guard<std::mutex> guard{mtx_};
    std::cerr << color_for(what->severity) << '[' << ts << "] ["
              << enum_str(what->severity) << "] ["
              << enum_str(what->component) << "] " << what->identifier << ": "
              << what->description << caf::term::reset_endl;
  }

  bool accepts(event::severity_level severity,
               event::component_type component) const override {
    return severity <= severity_ && has_component(mask_, component);
  }

private:
  event::severity_level severity_;
  event::component_mask mask_;
  std::mutex mtx_;
};

} // namespace

event_observer* logger() noexcept {
  return global_observer.get();
}

void logger(event_observer_ptr ptr) noexcept {
  global_observer = std::move(ptr);
}

event_observer_ptr logger_ptr() noexcept {
  return global_observer;
}

bool log_enabled(event::severity_level severity,
                 event::component_type component) noexcept {
  auto lptr = global_observer.get();
  return lptr != nullptr && lptr->accepts(severity, component);
}

event_observer_ptr make_console_logger(event::severity_level severity,
                                       event::component_mask mask) {
  return std::make_shared<console_logger>(severity, mask);
}

event_observer_ptr make_console_logger(std::string_view severity,
                                       event::component_mask mask) {
  auto level = event::severity_level::critical;
  if (!convert(severity, level)) {
    std::string msg = "invalid severity level: ";
    msg.insert(msg.end(), severity.begin(), severity.end());
    throw std::invalid_argument(msg);
  }
  return make_console_logger(level, mask);
}

} // namespace gossamer
