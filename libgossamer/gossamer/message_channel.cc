#include "gossamer/message_channel.hh"

#include "gossamer/detail/assert.hh"
#include "gossamer/error.hh"
#include "gossamer/format.hh"
#include "gossamer/logger.hh"

#include <caf/net/socket.hpp>

#include <cstddef>
#include <format>
#include <utility>

namespace gossamer {

message_channel::listener::~listener() {
  // nop
}

// -- constructors, destructors, and assignment operators ----------------------

message_channel::message_channel(multiplexer& mpx, caf::net::stream_socket fd,
                                 listener* owner, size_t read_chunk_size,
                                 size_t max_pending_output)
  : mpx_(&mpx),
    fd_(fd),
    listener_(owner),
    max_pending_output_(max_pending_output) {
  GOSSAMER_ASSERT(listener_ != nullptr);
  GOSSAMER_ASSERT(read_chunk_size > 0);
  rd_buf_.resize(read_chunk_size);
}

message_channel::~message_channel() {
  // Destroying the channel does not notify the listener.
  notified_ = true;
  close();
}

// -- operations ---------------------------------------------------------------

caf::error message_channel::start() {
  if (!running())
    return make_error(ec::logic_error, "cannot start a closed channel");
  if (auto err = caf::net::nonblocking(fd_, true))
    return make_error(ec::socket_failure, to_string(err));
  mpx_->register_reading(fd_.id, this);
  if (pending_output() > 0)
    mpx_->register_writing(fd_.id, this);
  return {};
}

caf::error message_channel::send(const message& msg) {
  if (!running())
    return make_error(ec::logic_error, "cannot send on a closed channel");
  if (written_ > 0 && written_ * 2 >= wr_buf_.size()) {
    wr_buf_.erase(wr_buf_.begin(),
                  wr_buf_.begin() + static_cast<ptrdiff_t>(written_));
    written_ = 0;
  }
  auto offset = wr_buf_.size();
  if (auto err = append_frame(wr_buf_, msg))
    return err;
  if (pending_output() > max_pending_output_) {
    auto frame_size = wr_buf_.size() - offset;
    wr_buf_.resize(offset);
    log::framing::warning("output-buffer-full",
                          "dropped a frame of {} bytes on fd {}: {} bytes "
                          "pending (limit: {})",
                          frame_size, fd_.id, pending_output(),
                          max_pending_output_);
    return make_error(ec::output_buffer_full,
                      std::format("{} bytes pending", pending_output()));
  }
  log::framing::debug("send-message", "queued {} on fd {}", msg, fd_.id);
  if (mpx_->is_registered(fd_.id))
    mpx_->register_writing(fd_.id, this);
  return {};
}

void message_channel::close() {
  if (!running())
    return;
  mpx_->deregister(fd_.id);
  caf::net::close(fd_);
  fd_ = caf::net::stream_socket{caf::net::invalid_socket_id};
  wr_buf_.clear();
  written_ = 0;
}

// -- socket_handler overrides -------------------------------------------------

void message_channel::handle_read_event() {
  // Frames go to the listener after each chunk, so an invalid prefix stops
  // the channel before it reads any further.
  for (size_t i = 0; i < defaults::max_reads_per_event && running(); ++i) {
    auto res = caf::net::read(fd_, rd_buf_);
    if (res > 0) {
      received_ += static_cast<size_t>(res);
      reader_.append(caf::const_byte_span{rd_buf_.data(),
                                          static_cast<size_t>(res)});
      deliver_frames();
      if (static_cast<size_t>(res) < rd_buf_.size())
        return;
    } else if (res == 0) {
      reader_.close();
      deliver_frames();
      return;
    } else if (caf::net::last_socket_error_is_temporary()) {
      return;
    } else {
      shutdown_with(make_error(ec::socket_failure,
                               "failed to read from socket: "
                                 + caf::net::last_socket_error_as_string()));
      return;
    }
  }
}

void message_channel::handle_write_event() {
  while (written_ < wr_buf_.size()) {
    auto res = caf::net::write(
      fd_, caf::const_byte_span{wr_buf_.data() + written_,
                                wr_buf_.size() - written_});
    if (res > 0) {
      written_ += static_cast<size_t>(res);
    } else if (res < 0 && caf::net::last_socket_error_is_temporary()) {
      return;
    } else {
      shutdown_with(make_error(ec::socket_failure,
                               "failed to write to socket: "
                                 + caf::net::last_socket_error_as_string()));
      return;
    }
  }
  wr_buf_.clear();
  written_ = 0;
  mpx_->unregister_writing(fd_.id);
}

void message_channel::handle_error(const caf::error& reason) {
  shutdown_with(reason);
}

// -- private utilities --------------------------------------------------------

void message_channel::deliver_frames() {
  while (running()) {
    auto frame = reader_.next();
    if (!frame) {
      log::framing::error("read-failed", "dropping fd {}: {}", fd_.id,
                          frame.error());
      shutdown_with(frame.error());
      return;
    }
    if (!*frame) {
      if (reader_.state() == frame_state::clean_eof)
        shutdown_with(caf::error{});
      return;
    }
    auto msg = decode_message<message>(**frame);
    if (!msg) {
      shutdown_with(msg.error());
      return;
    }
    listener_->on_message(*msg);
  }
}

void message_channel::shutdown_with(const caf::error& reason) {
  close();
  if (!notified_) {
    notified_ = true;
    listener_->on_closed(reason);
  }
}

} // namespace gossamer
