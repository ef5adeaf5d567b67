#pragma once

#include "gossamer/byte_stream.hh"
#include "gossamer/defaults.hh"
#include "gossamer/error.hh"
#include "gossamer/format/bin.hh"
#include "gossamer/logger.hh"

#include <caf/byte_buffer.hpp>
#include <caf/byte_span.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string_view>

// Each frame on the wire consists of a 4-byte unsigned big-endian length
// prefix followed by exactly that many payload bytes. Payloads must be smaller
// than `max_message_size`.

namespace gossamer {

/// Size of the length prefix in front of each frame.
constexpr size_t frame_prefix_size = defaults::framing::prefix_size;

/// Upper bound (exclusive) for the payload size of a frame.
constexpr size_t max_message_size = defaults::framing::max_message_size;

/// The states of a framed connection. `clean_eof` is only reachable from
/// `awaiting_prefix` with nothing buffered.
enum class frame_state : uint8_t {
  awaiting_prefix,
  accumulating_payload,
  have_message,
  clean_eof,
  error,
};

/// @relates frame_state
std::string_view enum_str(frame_state x) noexcept;

/// Returns the length prefix at the front of `buf` or `std::nullopt` if `buf`
/// holds less than `frame_prefix_size` bytes.
std::optional<uint32_t> peek_frame_size(caf::const_byte_span buf) noexcept;

/// Splits the first frame off the front of `buf`. Bytes that belong to
/// subsequent frames remain in `buf`.
/// @returns the payload of the first frame, `std::nullopt` if `buf` does not
///          hold a complete frame yet, or `ec::frame_too_large` if the length
///          prefix announces a payload of `max_message_size` or more.
caf::expected<std::optional<caf::byte_buffer>>
try_split_frame(caf::byte_buffer& buf);

/// Writes `payload` as a single frame.
/// @returns `ec::message_too_large` without writing anything if `payload` is
///          not smaller than `max_message_size`, otherwise the result of the
///          write.
caf::error write_lp(byte_stream& out, caf::const_byte_span payload);

/// Reads the next frame from `in`, using `buf` to keep bytes across calls.
/// Leftover bytes of subsequent frames remain in `buf`.
/// @returns the payload of the next frame, `std::nullopt` if the stream ended
///          cleanly at a frame boundary, or an error: `ec::frame_too_large` for
///          an oversized length prefix, `ec::truncated_frame` if the stream
///          ended inside a frame and `ec::socket_failure` if reading failed.
caf::expected<std::optional<caf::byte_buffer>>
read_lp(byte_stream& in, caf::byte_buffer& buf,
        size_t chunk_size = defaults::read_chunk_size);

namespace detail {

void write_frame_prefix(std::byte* first, uint32_t len) noexcept;

} // namespace detail

/// Serializes `msg` and appends it as a complete frame to `buf`. Leaves `buf`
/// unchanged on error.
template <class T>
caf::error append_frame(caf::byte_buffer& buf, const T& msg) {
  auto offset = buf.size();
  buf.resize(offset + frame_prefix_size);
  if (!format::bin::v1::encode_to(buf, msg)) {
    buf.resize(offset);
    return make_error(ec::serialization_failed);
  }
  auto len = buf.size() - offset - frame_prefix_size;
  if (len >= max_message_size) {
    buf.resize(offset);
    log::framing::warning("message-too-large",
                          "refused to send a message of {} bytes (limit: {})",
                          len, max_message_size);
    return make_error(ec::message_too_large,
                      std::format("serialized size {} exceeds the limit of {}",
                                  len, max_message_size - 1));
  }
  detail::write_frame_prefix(buf.data() + offset, static_cast<uint32_t>(len));
  return {};
}

/// Serializes `msg` into `scratch` and writes it as a single frame to `out`.
/// Rejects messages whose serialized size is `max_message_size` or more with
/// `ec::message_too_large` before writing any bytes.
template <class T>
caf::error write_message(byte_stream& out, caf::byte_buffer& scratch,
                         const T& msg) {
  scratch.clear();
  if (auto err = append_frame(scratch, msg))
    return err;
  return out.write(scratch);
}

/// Decodes a single message from `payload`.
template <class T>
caf::expected<T> decode_message(caf::const_byte_span payload) {
  T msg;
  auto first = payload.data();
  if (!format::bin::v1::decode_from(first, first + payload.size(), msg)) {
    log::framing::warning("deserialization-failed",
                          "failed to decode a frame of {} bytes",
                          payload.size());
    return make_error(ec::deserialization_failed);
  }
  return msg;
}

/// Reads the next frame from `in` and decodes it as `T`.
/// @returns the decoded message, `std::nullopt` if the stream ended cleanly
///          at a frame boundary, any error from `read_lp`, or
///          `ec::deserialization_failed` if the payload of a complete frame
///          does not decode as `T`.
template <class T>
caf::expected<std::optional<T>> read_message(byte_stream& in,
                                             caf::byte_buffer& buf) {
  auto frame = read_lp(in, buf);
  if (!frame)
    return std::move(frame.error());
  if (!*frame)
    return std::optional<T>{};
  auto msg = decode_message<T>(**frame);
  if (!msg)
    return std::move(msg.error());
  return std::optional<T>{std::move(*msg)};
}

/// Incremental variant of `read_lp` for non-blocking sockets: callers push
/// bytes as they arrive and pull complete frames.
class frame_reader {
public:
  frame_state state() const noexcept {
    return state_;
  }

  /// Returns the number of buffered bytes that do not belong to a returned
  /// frame yet.
  size_t buffered() const noexcept {
    return buf_.size() - pos_;
  }

  /// Adds bytes received from the peer.
  void append(caf::const_byte_span bytes);

  /// Signals that no more bytes will arrive.
  void close() noexcept {
    eof_ = true;
  }

  /// Returns the next complete frame. Returns `std::nullopt` if more input is
  /// required or after a clean end of the stream. In the latter case,
  /// `state()` returns `frame_state::clean_eof`. Errors are final: once
  /// `next` returned an error, it keeps returning that error.
  caf::expected<std::optional<caf::byte_buffer>> next();

private:
  caf::byte_buffer buf_;
  /// Start of the first byte in `buf_` that is not part of a returned frame.
  size_t pos_ = 0;
  caf::error err_;
  bool eof_ = false;
  frame_state state_ = frame_state::awaiting_prefix;
};

} // namespace gossamer
