#pragma once

#include "gossamer/defaults.hh"
#include "gossamer/framing.hh"
#include "gossamer/message.hh"
#include "gossamer/multiplexer.hh"

#include <caf/byte_buffer.hpp>
#include <caf/error.hpp>
#include <caf/net/stream_socket.hpp>

#include <cstddef>

namespace gossamer {

/// Exchanges framed ::message objects over a non-blocking stream socket that
/// the channel polls via the ::multiplexer.
class message_channel : public socket_handler {
public:
  // -- member types -----------------------------------------------------------

  /// Receives events from a channel. Listeners may call `send` and `close` on
  /// the channel from their callbacks but must not destroy it.
  class listener {
  public:
    virtual ~listener();

    /// Called for each message received from the peer.
    virtual void on_message(const message& msg) = 0;

    /// Called once after the channel stopped reading. A default-constructed
    /// `reason` indicates that the peer closed the stream at a frame boundary.
    virtual void on_closed(const caf::error& reason) = 0;
  };

  // -- constructors, destructors, and assignment operators --------------------

  /// Takes ownership of `fd`.
  message_channel(multiplexer& mpx, caf::net::stream_socket fd,
                  listener* owner,
                  size_t read_chunk_size = defaults::read_chunk_size,
                  size_t max_pending_output = defaults::max_pending_output);

  message_channel(const message_channel&) = delete;

  message_channel& operator=(const message_channel&) = delete;

  ~message_channel() override;

  // -- properties -------------------------------------------------------------

  /// Queries whether the channel still owns an open socket.
  bool running() const noexcept {
    return fd_.id != caf::net::invalid_socket_id;
  }

  /// Returns the number of bytes waiting for the socket to become writable.
  size_t pending_output() const noexcept {
    return wr_buf_.size() - written_;
  }

  /// Returns the total number of bytes read from the socket.
  size_t bytes_received() const noexcept {
    return received_;
  }

  /// Returns the state of the incoming frame stream.
  frame_state input_state() const noexcept {
    return reader_.state();
  }

  // -- operations -------------------------------------------------------------

  /// Switches the socket to non-blocking mode and starts reading.
  caf::error start();

  /// Queues `msg` for sending. Fails without queueing anything if `msg`
  /// exceeds the maximum message size, if the channel is closed, or with
  /// `ec::output_buffer_full` if the frame would push `pending_output` past
  /// the configured limit.
  caf::error send(const message& msg);

  /// Stops reading and writing and closes the socket. Discards pending output.
  void close();

  // -- socket_handler overrides -----------------------------------------------

  void handle_read_event() override;

  void handle_write_event() override;

  void handle_error(const caf::error& reason) override;

private:
  /// Passes all complete frames to the listener.
  void deliver_frames();

  /// Closes the socket and notifies the listener.
  void shutdown_with(const caf::error& reason);

  multiplexer* mpx_;
  caf::net::stream_socket fd_;
  listener* listener_;
  frame_reader reader_;
  caf::byte_buffer rd_buf_;
  caf::byte_buffer wr_buf_;
  size_t written_ = 0;
  size_t max_pending_output_;
  size_t received_ = 0;
  bool notified_ = false;
};

} // namespace gossamer
