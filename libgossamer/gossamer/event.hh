#pragma once

#include "gossamer/time.hh"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace gossamer {

/// Describes something that happened inside gossamer, e.g., a dial that
/// failed or a peer that sent an oversized frame.
class event {
public:
  /// Encodes the severity of the emitted event.
  enum class severity_level {
    /// Normal operation has most likely broken down.
    critical,
    /// An operation failed and its resource (connection, dial attempt) is
    /// gone, e.g., a framing violation on a connection.
    error,
    /// An unexpected state that gossamer could still recover from.
    warning,
    /// A noteworthy event during normal operation such as a new connection.
    info,
    /// Information that might help a user understand the system behavior.
    verbose,
    /// Information relevant only for troubleshooting.
    debug
  };

  /// Encodes the component that has emitted the event.
  enum class component_type : uint32_t {
    /// The reactor loop has emitted the event.
    multiplexer = 0b00'0001,
    /// The dialer has emitted the event.
    dialer = 0b00'0010,
    /// A timer multiplexer has emitted the event.
    timers = 0b00'0100,
    /// The message framing layer has emitted the event.
    framing = 0b00'1000,
    /// A transport implementation has emitted the event.
    transport = 0b01'0000,
    /// A user-defined component has emitted the event.
    app = 0b10'0000,
  };

  enum class component_mask : uint32_t {};

  static constexpr auto nil_component_mask = static_cast<component_mask>(0);

  static constexpr auto default_component_mask =
    static_cast<component_mask>(0xFFFFFFFF);

  /// The time when the event has been emitted.
  wall_timestamp timestamp;

  /// Stores the severity for this event.
  severity_level severity;

  /// Stores which component has emitted this event.
  component_type component;

  /// A unique identifier for the event. Always points to a string literal.
  std::string_view identifier;

  /// A human-readable description of the logged event.
  std::string description;

  event(severity_level severity, component_type component,
        std::string_view identifier, std::string description)
    : timestamp(wall_now()),
      severity(severity),
      component(component),
      identifier(identifier),
      description(std::move(description)) {}
};

constexpr event::component_mask operator|(event::component_type lhs,
                                          event::component_type rhs) noexcept {
  auto res = static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs);
  return static_cast<event::component_mask>(res);
}

constexpr event::component_mask operator|(event::component_mask lhs,
                                          event::component_type rhs) noexcept {
  auto res = static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs);
  return static_cast<event::component_mask>(res);
}

constexpr bool has_component(event::component_mask mask,
                             event::component_type component) noexcept {
  return (static_cast<uint32_t>(mask) & static_cast<uint32_t>(component)) != 0;
}

/// @relates event::severity_level
std::string_view enum_str(event::severity_level level) noexcept;

/// @relates event::severity_level
bool convert(std::string_view str, event::severity_level& level) noexcept;

/// @relates event::component_type
std::string_view enum_str(event::component_type component) noexcept;

/// A smart pointer holding an immutable ::event.
using event_ptr = std::shared_ptr<const event>;

} // namespace gossamer
