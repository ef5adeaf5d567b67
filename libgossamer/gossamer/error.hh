#pragma once

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/is_error_code_enum.hpp>
#include <caf/type_id.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace gossamer {

/// Error codes used by gossamer. Errors travel as `caf::error` with this enum
/// as category.
enum class ec : uint8_t {
  /// Not-an-error.
  none,
  /// The unspecified default error code.
  unspecified,
  /// The caller aborted a dial before the connection was established.
  dial_cancelled,
  /// The transport could not establish a connection to the peer.
  peer_unavailable,
  /// The transport has no address for the peer.
  unknown_peer,
  /// A connect attempt did not finish within the configured timeout.
  connect_timeout,
  /// A serialized message is at or above the maximum message size.
  message_too_large,
  /// A received length prefix is at or above the maximum message size.
  frame_too_large,
  /// The stream ended in the middle of a frame.
  truncated_frame,
  /// A complete frame did not parse as the expected message type.
  deserialization_failed,
  /// Failed to serialize a message.
  serialization_failed,
  /// An operation on a socket failed.
  socket_failure,
  /// The multiplexer no longer accepts work.
  shutting_down,
  /// A connection has no stream left to open.
  stream_unavailable,
  /// A channel refused to queue more output for a slow peer.
  output_buffer_full,
  /// An operation was called in a state that does not allow it.
  logic_error,
};

/// @relates ec
std::string to_string(ec code);

/// Returns the name of `code` as a string view to static storage.
/// @relates ec
std::string_view enum_str(ec code);

/// @relates ec
bool convert(std::string_view str, ec& code) noexcept;

/// @relates ec
bool from_string(std::string_view str, ec& code) noexcept;

/// @relates ec
bool from_integer(std::underlying_type_t<ec> value, ec& code) noexcept;

/// @relates ec
template <class Inspector>
bool inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

/// @relates ec
inline void convert(ec code, std::string& str) {
  str = enum_str(code);
}

/// Renders `err` as human-readable string.
void convert(const caf::error& err, std::string& str);

inline caf::error make_error(ec code) {
  return caf::make_error(code);
}

inline caf::error make_error(ec code, std::string description) {
  return caf::make_error(code, std::move(description));
}

/// Returns the gossamer error code of `err` or `ec::unspecified` if `err`
/// belongs to another category.
ec code_of(const caf::error& err) noexcept;

} // namespace gossamer

CAF_BEGIN_TYPE_ID_BLOCK(gossamer, caf::first_custom_type_id)

  CAF_ADD_TYPE_ID(gossamer, (gossamer::ec))

CAF_END_TYPE_ID_BLOCK(gossamer)

CAF_ERROR_CODE_ENUM(gossamer::ec)
