#include "gossamer/byte_stream.hh"

#include "gossamer/error.hh"

#include <caf/net/socket.hpp>

#include <algorithm>
#include <cerrno>
#include <string>

namespace gossamer {

byte_stream::~byte_stream() {
  // nop
}

// -- socket_stream ------------------------------------------------------------

socket_stream::socket_stream(caf::net::stream_socket fd) noexcept : fd_(fd) {
  // nop
}

socket_stream::~socket_stream() {
  if (fd_.id != caf::net::invalid_socket_id)
    caf::net::close(fd_);
}

ptrdiff_t socket_stream::read(caf::byte_span buf) {
  for (;;) {
    auto res = caf::net::read(fd_, buf);
    if (res < 0 && errno == EINTR)
      continue;
    return res;
  }
}

caf::error socket_stream::write(caf::const_byte_span buf) {
  auto pos = buf.data();
  auto remaining = buf.size();
  while (remaining > 0) {
    auto res = caf::net::write(fd_, caf::const_byte_span{pos, remaining});
    if (res > 0) {
      pos += res;
      remaining -= static_cast<size_t>(res);
    } else if (res < 0 && errno == EINTR) {
      continue;
    } else {
      return make_error(ec::socket_failure,
                        "failed to write to socket: "
                          + caf::net::last_socket_error_as_string());
    }
  }
  return {};
}

caf::net::stream_socket socket_stream::release() noexcept {
  auto result = fd_;
  fd_ = caf::net::stream_socket{caf::net::invalid_socket_id};
  return result;
}

// -- memory_stream ------------------------------------------------------------

ptrdiff_t memory_stream::read(caf::byte_span buf) {
  ++num_reads_;
  if (buf_.empty())
    return fail_at_end_ ? -1 : 0;
  auto n = std::min(buf.size(), buf_.size());
  if (max_chunk_size_ > 0)
    n = std::min(n, max_chunk_size_);
  auto last = buf_.begin() + static_cast<ptrdiff_t>(n);
  std::copy(buf_.begin(), last, buf.data());
  buf_.erase(buf_.begin(), last);
  return static_cast<ptrdiff_t>(n);
}

caf::error memory_stream::write(caf::const_byte_span buf) {
  bytes_written_ += buf.size();
  buf_.insert(buf_.end(), buf.begin(), buf.end());
  return {};
}

void memory_stream::feed(caf::const_byte_span bytes) {
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

} // namespace gossamer
