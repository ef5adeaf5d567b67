#pragma once

#include "gossamer/event.hh"
#include "gossamer/event_observer.hh"

#include <format>
#include <memory>
#include <string_view>
#include <utility>

namespace gossamer {

// -- global observer ----------------------------------------------------------

/// Returns the observer that receives all log events or `nullptr` if logging
/// is disabled.
event_observer* logger() noexcept;

/// Replaces the observer that receives all log events. Passing `nullptr`
/// disables logging.
/// @note Not thread-safe. Install the logger before starting any multiplexer.
void logger(event_observer_ptr ptr) noexcept;

/// Returns a shared handle to the current observer.
event_observer_ptr logger_ptr() noexcept;

/// Checks whether the current observer wants events with `severity` from
/// `component`.
bool log_enabled(event::severity_level severity,
                 event::component_type component) noexcept;

/// Installs an observer for the lifetime of the guard and puts the previous
/// observer back on destruction.
class scoped_logger {
public:
  explicit scoped_logger(event_observer_ptr ptr) : prev_(logger_ptr()) {
    logger(std::move(ptr));
  }

  scoped_logger(const scoped_logger&) = delete;

  scoped_logger& operator=(const scoped_logger&) = delete;

  ~scoped_logger() {
    logger(std::move(prev_));
  }

private:
  event_observer_ptr prev_;
};

// -- console output -----------------------------------------------------------

/// Creates an observer that prints one line per event to `std::cerr`.
event_observer_ptr
make_console_logger(event::severity_level severity,
                    event::component_mask mask = event::default_component_mask);

/// Creates an observer that prints one line per event to `std::cerr`.
/// @param severity One of "critical", "error", "warning", "info", "verbose"
///                 or "debug".
/// @throws std::invalid_argument if `severity` names no severity level.
event_observer_ptr
make_console_logger(std::string_view severity,
                    event::component_mask mask = event::default_component_mask);

/// Installs a console logger as the global observer.
inline void
set_console_logger(std::string_view severity,
                   event::component_mask mask = event::default_component_mask) {
  logger(make_console_logger(severity, mask));
}

// -- emitting events ----------------------------------------------------------

/// Emits events on behalf of component `Component`. Formatting only happens
/// if the current observer accepts the event.
template <event::component_type Component>
struct component_logger {
  static constexpr auto component = Component;

  template <class... Ts>
  static void emit(event::severity_level severity, std::string_view identifier,
                   std::format_string<Ts...> fmt_str, Ts&&... args) {
    auto lptr = logger();
    if (lptr == nullptr || !lptr->accepts(severity, Component))
      return;
    lptr->observe(std::make_shared<event>(
      severity, Component, identifier,
      std::format(fmt_str, std::forward<Ts>(args)...)));
  }

  template <class... Ts>
  static void critical(std::string_view identifier,
                       std::format_string<Ts...> fmt_str, Ts&&... args) {
    emit(event::severity_level::critical, identifier, fmt_str,
         std::forward<Ts>(args)...);
  }

  template <class... Ts>
  static void error(std::string_view identifier,
                    std::format_string<Ts...> fmt_str, Ts&&... args) {
    emit(event::severity_level::error, identifier, fmt_str,
         std::forward<Ts>(args)...);
  }

  template <class... Ts>
  static void warning(std::string_view identifier,
                      std::format_string<Ts...> fmt_str, Ts&&... args) {
    emit(event::severity_level::warning, identifier, fmt_str,
         std::forward<Ts>(args)...);
  }

  template <class... Ts>
  static void info(std::string_view identifier,
                   std::format_string<Ts...> fmt_str, Ts&&... args) {
    emit(event::severity_level::info, identifier, fmt_str,
         std::forward<Ts>(args)...);
  }

  template <class... Ts>
  static void verbose(std::string_view identifier,
                      std::format_string<Ts...> fmt_str, Ts&&... args) {
    emit(event::severity_level::verbose, identifier, fmt_str,
         std::forward<Ts>(args)...);
  }

  template <class... Ts>
  static void debug(std::string_view identifier,
                    std::format_string<Ts...> fmt_str, Ts&&... args) {
    emit(event::severity_level::debug, identifier, fmt_str,
         std::forward<Ts>(args)...);
  }
};

} // namespace gossamer

namespace gossamer::log {

using multiplexer = component_logger<event::component_type::multiplexer>;

using dialer = component_logger<event::component_type::dialer>;

using timers = component_logger<event::component_type::timers>;

using framing = component_logger<event::component_type::framing>;

using transport = component_logger<event::component_type::transport>;

/// For events emitted by applications on top of gossamer.
using app = component_logger<event::component_type::app>;

} // namespace gossamer::log
