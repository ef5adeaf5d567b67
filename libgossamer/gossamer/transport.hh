#pragma once

#include "gossamer/byte_stream.hh"
#include "gossamer/message_channel.hh"
#include "gossamer/multiplexer.hh"
#include "gossamer/peer_id.hh"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace gossamer {

/// An established connection to a peer.
class connection {
public:
  virtual ~connection();

  /// Returns the ID of the remote peer.
  virtual const peer_id& remote() const noexcept = 0;

  /// Returns the protocol tag this connection was established for.
  virtual std::string_view protocol() const noexcept = 0;

  /// Opens an ordered byte stream on this connection.
  virtual caf::expected<byte_stream_ptr> open_stream() = 0;

  /// Hands the connection over to a started ::message_channel that runs on
  /// `mpx` and reports to `owner`. The channel owns the underlying socket
  /// afterwards, so a connection either opens a channel or a stream.
  /// @returns the channel or `ec::stream_unavailable` if the connection has
  ///          no socket left to hand over.
  virtual caf::expected<std::unique_ptr<message_channel>>
  open_channel(multiplexer& mpx, message_channel::listener* owner);

  /// Closes the connection. Streams opened earlier remain usable until their
  /// owners destroy them.
  virtual void close() = 0;
};

/// @relates connection
using connection_ptr = std::shared_ptr<connection>;

/// Cancels an outstanding connect operation on disposal. Disposing abandons the
/// operation: its callback never runs afterwards.
class connect_handle {
public:
  connect_handle() = default;

  explicit connect_handle(std::function<void()> abandon)
    : abandon_(std::move(abandon)) {
    // nop
  }

  connect_handle(connect_handle&&) noexcept = default;

  connect_handle& operator=(connect_handle&&) noexcept = default;

  connect_handle(const connect_handle&) = delete;

  connect_handle& operator=(const connect_handle&) = delete;

  /// Abandons the connect operation. Calling this function again has no
  /// effect.
  void dispose() {
    if (abandon_) {
      auto f = std::move(abandon_);
      abandon_ = nullptr;
      f();
    }
  }

  /// Queries whether `dispose` has not been called yet.
  bool valid() const noexcept {
    return static_cast<bool>(abandon_);
  }

private:
  std::function<void()> abandon_;
};

/// Establishes connections to peers.
///
/// Handles returned by `async_connect` may outlive the transport. Disposing a
/// handle after the transport is gone has no effect.
class transport {
public:
  using connect_callback = std::function<void(caf::expected<connection_ptr>)>;

  virtual ~transport();

  /// Starts connecting to `peer` for `protocol`. The transport calls `f`
  /// exactly once from the multiplexer loop unless the caller disposes the
  /// returned handle first. The transport never calls `f` before
  /// `async_connect` returns.
  virtual connect_handle async_connect(const peer_id& peer,
                                       std::string_view protocol,
                                       connect_callback f)
    = 0;
};

/// @relates transport
using transport_ptr = std::shared_ptr<transport>;

} // namespace gossamer
