#pragma once

#include <caf/byte_buffer.hpp>
#include <caf/byte_span.hpp>
#include <caf/error.hpp>
#include <caf/net/stream_socket.hpp>

#include <cstddef>
#include <deque>
#include <memory>

namespace gossamer {

/// An ordered, reliable stream of bytes, e.g., one direction of a TCP
/// connection.
class byte_stream {
public:
  virtual ~byte_stream();

  /// Reads up to `buf.size()` bytes into `buf`. Blocks until at least one byte
  /// is available.
  /// @returns the number of bytes read, 0 at the end of the stream or a
  ///          negative value on error.
  virtual ptrdiff_t read(caf::byte_span buf) = 0;

  /// Writes all of `buf` to the stream.
  virtual caf::error write(caf::const_byte_span buf) = 0;
};

/// @relates byte_stream
using byte_stream_ptr = std::unique_ptr<byte_stream>;

/// A blocking byte stream on top of a connected socket. Owns the socket.
class socket_stream : public byte_stream {
public:
  explicit socket_stream(caf::net::stream_socket fd) noexcept;

  socket_stream(const socket_stream&) = delete;

  socket_stream& operator=(const socket_stream&) = delete;

  ~socket_stream() override;

  ptrdiff_t read(caf::byte_span buf) override;

  caf::error write(caf::const_byte_span buf) override;

  /// Returns the managed socket.
  caf::net::stream_socket handle() const noexcept {
    return fd_;
  }

  /// Transfers ownership of the socket to the caller.
  caf::net::stream_socket release() noexcept;

private:
  caf::net::stream_socket fd_;
};

/// An in-memory byte stream: writes append to a buffer that subsequent reads
/// consume. Reading from an empty stream signals the end of the stream (or an
/// error if configured via `fail_at_end`). Mostly useful for testing.
class memory_stream : public byte_stream {
public:
  /// @param max_chunk_size Upper bound for the bytes returned by one `read`.
  explicit memory_stream(size_t max_chunk_size = 0) noexcept
    : max_chunk_size_(max_chunk_size) {
    // nop
  }

  ptrdiff_t read(caf::byte_span buf) override;

  caf::error write(caf::const_byte_span buf) override;

  /// Appends `bytes` to the readable data without counting them as written.
  void feed(caf::const_byte_span bytes);

  /// Causes reads at the end of the data to fail instead of returning 0.
  void fail_at_end(bool value) noexcept {
    fail_at_end_ = value;
  }

  /// Returns how many bytes callers have passed to `write`.
  size_t bytes_written() const noexcept {
    return bytes_written_;
  }

  /// Returns how many bytes are available for reading.
  size_t available() const noexcept {
    return buf_.size();
  }

  /// Returns how many times `read` has been called.
  size_t num_reads() const noexcept {
    return num_reads_;
  }

private:
  std::deque<std::byte> buf_;
  size_t max_chunk_size_;
  size_t bytes_written_ = 0;
  size_t num_reads_ = 0;
  bool fail_at_end_ = false;
};

} // namespace gossamer
