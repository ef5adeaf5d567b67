#include "gossamer/tcp_transport.hh"

#include "gossamer/detail/assert.hh"
#include "gossamer/error.hh"
#include "gossamer/format.hh"
#include "gossamer/logger.hh"

#include <caf/net/network_socket.hpp>
#include <caf/net/socket.hpp>

#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace gossamer {

// -- tcp_connection -----------------------------------------------------------

tcp_connection::tcp_connection(peer_id remote, std::string protocol,
                               caf::net::stream_socket fd) noexcept
  : remote_(remote), protocol_(std::move(protocol)), fd_(fd) {
  // nop
}

tcp_connection::~tcp_connection() {
  close();
}

const peer_id& tcp_connection::remote() const noexcept {
  return remote_;
}

std::string_view tcp_connection::protocol() const noexcept {
  return protocol_;
}

caf::expected<caf::net::stream_socket> tcp_connection::release_socket() {
  if (fd_.id == caf::net::invalid_socket_id)
    return make_error(ec::stream_unavailable,
                      "the connection has no stream left to open");
  auto fd = fd_;
  fd_ = caf::net::stream_socket{caf::net::invalid_socket_id};
  return fd;
}

caf::expected<byte_stream_ptr> tcp_connection::open_stream() {
  auto fd = release_socket();
  if (!fd)
    return std::move(fd.error());
  if (auto err = caf::net::nonblocking(*fd, false)) {
    caf::net::close(*fd);
    return make_error(ec::socket_failure, to_string(err));
  }
  return byte_stream_ptr{new socket_stream(*fd)};
}

caf::expected<std::unique_ptr<message_channel>>
tcp_connection::open_channel(multiplexer& mpx,
                             message_channel::listener* owner) {
  auto fd = release_socket();
  if (!fd)
    return std::move(fd.error());
  log::transport::debug("open-channel", "running a channel to peer {} on fd {}",
                        remote_.short_string(), fd->id);
  auto result = std::make_unique<message_channel>(mpx, *fd, owner);
  if (auto err = result->start())
    return err;
  return result;
}

void tcp_connection::close() {
  if (fd_.id != caf::net::invalid_socket_id) {
    caf::net::close(fd_);
    fd_ = caf::net::stream_socket{caf::net::invalid_socket_id};
  }
}

// -- connect_state ------------------------------------------------------------

class tcp_transport::connect_state : public socket_handler {
public:
  using addrinfo_ptr = std::unique_ptr<addrinfo, decltype(&freeaddrinfo)>;

  connect_state(tcp_transport* owner, uint64_t id, peer_id peer,
                std::string protocol, connect_callback f)
    : owner(owner),
      id(id),
      peer(peer),
      protocol(std::move(protocol)),
      callback(std::move(f)) {
    // nop
  }

  ~connect_state() override {
    if (timeout != multiplexer::invalid_action_id)
      owner->mpx_->cancel(timeout);
    if (delivery != multiplexer::invalid_action_id)
      owner->mpx_->cancel(delivery);
    close_socket();
  }

  void close_socket() {
    if (fd != caf::net::invalid_socket_id) {
      owner->mpx_->deregister(fd);
      caf::net::close(caf::net::socket{fd});
      fd = caf::net::invalid_socket_id;
    }
  }

  /// Creates a socket for `ai` and starts a non-blocking connect on it.
  caf::error try_connect(const addrinfo& ai) {
    fd = ::socket(ai.ai_family, ai.ai_socktype, ai.ai_protocol);
    if (fd == caf::net::invalid_socket_id)
      return make_error(ec::socket_failure,
                        "failed to create a socket: "
                          + caf::net::last_socket_error_as_string());
    auto sock = caf::net::network_socket{fd};
    if (auto err = caf::net::nonblocking(sock, true)) {
      close_socket();
      return make_error(ec::socket_failure, to_string(err));
    }
    if (auto err = caf::net::allow_sigpipe(sock, false)) {
      close_socket();
      return make_error(ec::socket_failure, to_string(err));
    }
    if (::connect(fd, ai.ai_addr, ai.ai_addrlen) != 0 && errno != EINPROGRESS) {
      auto what = caf::net::last_socket_error_as_string();
      close_socket();
      return make_error(ec::peer_unavailable,
                        "failed to connect to " + to_string(addr) + ": "
                          + what);
    }
    // Even if connect succeeded immediately, the socket reports writable on
    // the next poll and we pick up the result in handle_write_event.
    owner->mpx_->register_writing(fd, this);
    return {};
  }

  /// Tries the remaining resolved addresses in order until a connect gets
  /// underway.
  /// @returns the error of the last address if none is left.
  caf::error connect_next() {
    auto err = make_error(ec::peer_unavailable,
                          "no address left for " + to_string(addr));
    while (next_addr != nullptr) {
      auto ai = next_addr;
      next_addr = ai->ai_next;
      err = try_connect(*ai);
      if (!err)
        return {};
      log::transport::debug("connect-failed", "{}", err);
    }
    return err;
  }

  void handle_read_event() override {
    // nop
  }

  void handle_write_event() override {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
      err = errno;
    if (err != 0) {
      retry_or_fail(std::strerror(err));
      return;
    }
    owner->mpx_->deregister(fd);
    // The socket stays in non-blocking mode.
    auto sock = caf::net::stream_socket{fd};
    fd = caf::net::invalid_socket_id;
    log::transport::debug("connect-ok", "connected to peer {} on fd {}",
                          peer.short_string(), sock.id);
    auto conn = std::make_shared<tcp_connection>(peer, std::move(protocol),
                                                 sock);
    // Destroys this object.
    owner->finish(id, connection_ptr{std::move(conn)});
  }

  void handle_error(const caf::error& reason) override {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err != 0)
      retry_or_fail(std::strerror(err));
    else
      retry_or_fail(to_string(reason));
  }

  /// Moves on to the next resolved address after a failed connect or reports
  /// the failure if no address is left.
  void retry_or_fail(const std::string& what) {
    close_socket();
    if (next_addr == nullptr) {
      fail(what);
      return;
    }
    log::transport::debug("connect-retry",
                          "failed to connect to {}: {}, trying the next "
                          "address",
                          addr, what);
    if (auto err = connect_next()) {
      // Destroys this object.
      owner->finish(id, std::move(err));
    }
  }

  void fail(const std::string& what) {
    log::transport::debug("connect-failed", "failed to connect to peer {}: {}",
                          peer.short_string(), what);
    // Destroys this object.
    owner->finish(id, make_error(ec::peer_unavailable, what));
  }

  tcp_transport* owner;
  uint64_t id;
  peer_id peer;
  std::string protocol;
  connect_callback callback;
  network_info addr;
  addrinfo_ptr addrs{nullptr, freeaddrinfo};
  addrinfo* next_addr = nullptr;
  caf::net::socket_id fd = caf::net::invalid_socket_id;
  multiplexer::action_id timeout = multiplexer::invalid_action_id;
  multiplexer::action_id delivery = multiplexer::invalid_action_id;
};

// -- constructors, destructors, and assignment operators ----------------------

tcp_transport::tcp_transport(multiplexer& mpx, timespan connect_timeout)
  : mpx_(&mpx),
    connect_timeout_(connect_timeout),
    self_(std::make_shared<tcp_transport*>(this)) {
  // nop
}

tcp_transport::~tcp_transport() {
  self_.reset();
  states_.clear();
}

// -- address book -------------------------------------------------------------

void tcp_transport::add_address(const peer_id& peer, network_info addr) {
  log::transport::debug("add-address", "peer {} is reachable at {}",
                        peer.short_string(), addr);
  addresses_.insert_or_assign(peer, std::move(addr));
}

bool tcp_transport::remove_address(const peer_id& peer) {
  return addresses_.erase(peer) > 0;
}

std::optional<network_info>
tcp_transport::address_of(const peer_id& peer) const {
  if (auto i = addresses_.find(peer); i != addresses_.end())
    return i->second;
  return std::nullopt;
}

// -- transport interface ------------------------------------------------------

connect_handle tcp_transport::async_connect(const peer_id& peer,
                                            std::string_view protocol,
                                            connect_callback f) {
  GOSSAMER_ASSERT(f != nullptr);
  auto id = ++last_id_;
  auto& st = *states_
                .emplace(id, std::make_unique<connect_state>(
                               this, id, peer, std::string{protocol},
                               std::move(f)))
                .first->second;
  connect_handle result{[weak_self = std::weak_ptr{self_}, id] {
    if (auto self = weak_self.lock())
      (*self)->abandon(id);
  }};
  if (mpx_->shutting_down()) {
    post_result(st, make_error(ec::shutting_down));
    return result;
  }
  auto i = addresses_.find(peer);
  if (i == addresses_.end()) {
    log::transport::debug("unknown-peer", "no address for peer {}",
                          peer.short_string());
    post_result(st, make_error(ec::unknown_peer, "no address for peer "
                                                   + peer.short_string()));
    return result;
  }
  if (auto err = start_connect(st, i->second)) {
    post_result(st, std::move(err));
    return result;
  }
  return result;
}

caf::error tcp_transport::start_connect(connect_state& st,
                                        const network_info& addr) {
  log::transport::debug("try-connect",
                        "try connecting to {} with a timeout of {}", addr,
                        to_string(connect_timeout_));
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV;
  addrinfo* addrs = nullptr;
  auto port = std::to_string(addr.port);
  if (auto rc = getaddrinfo(addr.address.c_str(), port.c_str(), &hints, &addrs);
      rc != 0) {
    return make_error(ec::peer_unavailable,
                      "failed to resolve " + to_string(addr) + ": "
                        + gai_strerror(rc));
  }
  st.addr = addr;
  st.addrs.reset(addrs);
  st.next_addr = addrs;
  if (auto err = st.connect_next())
    return err;
  auto id = st.id;
  st.timeout = mpx_->schedule_after(connect_timeout_, [this, id, addr] {
    if (auto i = states_.find(id); i != states_.end())
      i->second->timeout = multiplexer::invalid_action_id;
    log::transport::debug("connect-timeout", "connecting to {} timed out",
                          addr);
    finish(id, make_error(ec::connect_timeout,
                          "connecting to " + to_string(addr) + " timed out"));
  });
  return {};
}

void tcp_transport::post_result(connect_state& st, caf::error reason) {
  auto id = st.id;
  st.delivery = mpx_->post([this, id, reason{std::move(reason)}]() mutable {
    if (auto i = states_.find(id); i != states_.end())
      i->second->delivery = multiplexer::invalid_action_id;
    finish(id, std::move(reason));
  });
}

void tcp_transport::finish(uint64_t id, caf::expected<connection_ptr> res) {
  auto i = states_.find(id);
  if (i == states_.end())
    return;
  auto st = std::move(i->second);
  states_.erase(i);
  auto f = std::move(st->callback);
  // Releases the socket, the timeout and any posted action.
  st.reset();
  f(std::move(res));
}

void tcp_transport::abandon(uint64_t id) {
  if (auto i = states_.find(id); i != states_.end()) {
    log::transport::debug("abandon-connect", "abandon connecting to peer {}",
                          i->second->peer.short_string());
    states_.erase(i);
  }
}

} // namespace gossamer
