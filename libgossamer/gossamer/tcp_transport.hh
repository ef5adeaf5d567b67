#pragma once

#include "gossamer/defaults.hh"
#include "gossamer/multiplexer.hh"
#include "gossamer/network_info.hh"
#include "gossamer/peer_id.hh"
#include "gossamer/time.hh"
#include "gossamer/transport.hh"

#include <caf/net/stream_socket.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gossamer {

/// A connection established by a ::tcp_transport. Hands out its socket once,
/// either as a non-blocking ::message_channel on the multiplexer or as a
/// blocking ::socket_stream.
class tcp_connection : public connection {
public:
  tcp_connection(peer_id remote, std::string protocol,
                 caf::net::stream_socket fd) noexcept;

  tcp_connection(const tcp_connection&) = delete;

  tcp_connection& operator=(const tcp_connection&) = delete;

  ~tcp_connection() override;

  const peer_id& remote() const noexcept override;

  std::string_view protocol() const noexcept override;

  /// Returns the stream for the socket after switching it to blocking mode.
  /// Fails with `ec::stream_unavailable` once the socket has been handed out
  /// or after `close`.
  caf::expected<byte_stream_ptr> open_stream() override;

  /// Passes the non-blocking socket to a new channel and starts it. Fails
  /// with `ec::stream_unavailable` once the socket has been handed out or
  /// after `close`.
  caf::expected<std::unique_ptr<message_channel>>
  open_channel(multiplexer& mpx, message_channel::listener* owner) override;

  /// Transfers ownership of the socket to the caller.
  caf::expected<caf::net::stream_socket> release_socket();

  void close() override;

private:
  peer_id remote_;
  std::string protocol_;
  caf::net::stream_socket fd_;
};

/// Connects to peers via TCP, using an address book that maps peer IDs to
/// network addresses. Connecting runs on the ::multiplexer and never blocks
/// the loop except for resolving host names.
class tcp_transport : public transport {
public:
  // -- constructors, destructors, and assignment operators --------------------

  explicit tcp_transport(multiplexer& mpx,
                         timespan connect_timeout = defaults::connect_timeout);

  tcp_transport(const tcp_transport&) = delete;

  tcp_transport& operator=(const tcp_transport&) = delete;

  /// Abandons all outstanding connect attempts. Handles returned by
  /// `async_connect` stay safe to dispose afterwards.
  ~tcp_transport() override;

  // -- address book -----------------------------------------------------------

  /// Stores `addr` as the address of `peer`, replacing any previous entry.
  void add_address(const peer_id& peer, network_info addr);

  /// Removes the address of `peer`. Does not affect outstanding attempts.
  /// @returns `true` if an entry was removed.
  bool remove_address(const peer_id& peer);

  /// Returns the address of `peer` if known.
  std::optional<network_info> address_of(const peer_id& peer) const;

  // -- properties -------------------------------------------------------------

  timespan connect_timeout() const noexcept {
    return connect_timeout_;
  }

  /// Returns the number of connect attempts that have not produced a result.
  size_t num_connecting() const noexcept {
    return states_.size();
  }

  // -- transport interface ----------------------------------------------------

  connect_handle async_connect(const peer_id& peer, std::string_view protocol,
                               connect_callback f) override;

private:
  class connect_state;

  friend class connect_state;

  using connect_state_ptr = std::unique_ptr<connect_state>;

  /// Resolves `addr` and starts a non-blocking connect on `st`, trying each
  /// resolved address until one connect gets underway.
  caf::error start_connect(connect_state& st, const network_info& addr);

  /// Delivers `res` from a posted action.
  void post_result(connect_state& st, caf::error reason);

  /// Removes the state for `id` and calls its callback with `res`.
  void finish(uint64_t id, caf::expected<connection_ptr> res);

  /// Removes the state for `id` without calling its callback.
  void abandon(uint64_t id);

  multiplexer* mpx_;

  timespan connect_timeout_;

  std::unordered_map<peer_id, network_info> addresses_;

  std::unordered_map<uint64_t, connect_state_ptr> states_;

  uint64_t last_id_ = 0;

  /// Points to this transport until it is destroyed. Connect handles keep a
  /// weak reference.
  std::shared_ptr<tcp_transport*> self_;
};

} // namespace gossamer
