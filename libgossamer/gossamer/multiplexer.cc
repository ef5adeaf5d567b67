#include "gossamer/multiplexer.hh"

#include "gossamer/detail/assert.hh"
#include "gossamer/error.hh"
#include "gossamer/format.hh"
#include "gossamer/logger.hh"

#include <caf/byte_span.hpp>
#include <caf/net/socket.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstddef>
#include <stdexcept>
#include <string>

#ifndef POLLRDHUP
#  define POLLRDHUP POLLHUP
#endif

namespace gossamer {

namespace {

#ifdef GOSSAMER_LINUX
constexpr short read_mask = POLLIN | POLLPRI;
#else
constexpr short read_mask = POLLIN;
#endif

constexpr short write_mask = POLLOUT;

constexpr short error_mask = POLLRDHUP | POLLERR | POLLHUP | POLLNVAL;

} // namespace

socket_handler::~socket_handler() {
  // nop
}

// -- constructors, destructors, and assignment operators ----------------------

multiplexer::multiplexer() {
  auto fds = caf::net::make_pipe();
  if (!fds) {
    log::multiplexer::critical("pipe-failed", "failed to create a pipe: {}",
                               fds.error());
    throw std::runtime_error("failed to create the wakeup pipe");
  }
  wakeup_rd_ = fds->first;
  wakeup_wr_ = fds->second;
  if (auto err = caf::net::nonblocking(wakeup_rd_, true)) {
    caf::net::close(wakeup_rd_);
    caf::net::close(wakeup_wr_);
    throw std::runtime_error("failed to configure the wakeup pipe");
  }
}

multiplexer::~multiplexer() {
  caf::net::close(wakeup_rd_);
  caf::net::close(wakeup_wr_);
}

// -- socket management --------------------------------------------------------

void multiplexer::update_mask(caf::net::socket_id fd, socket_handler* handler,
                              short add_mask, short del_mask) {
  auto i = sockets_.find(fd);
  if (i == sockets_.end()) {
    if (add_mask == 0)
      return;
    GOSSAMER_ASSERT(handler != nullptr);
    sockets_.emplace(fd, registration{handler, add_mask, ++last_generation_});
    log::multiplexer::debug("register-socket", "register socket {}", fd);
    return;
  }
  auto& reg = i->second;
  if (handler != nullptr && handler != reg.handler) {
    reg.handler = handler;
    reg.generation = ++last_generation_;
  }
  reg.events = static_cast<short>((reg.events | add_mask) & ~del_mask);
  if (reg.events == 0) {
    log::multiplexer::debug("deregister-socket", "deregister socket {}", fd);
    sockets_.erase(i);
  }
}

void multiplexer::register_reading(caf::net::socket_id fd,
                                   socket_handler* handler) {
  update_mask(fd, handler, read_mask, 0);
}

void multiplexer::register_writing(caf::net::socket_id fd,
                                   socket_handler* handler) {
  update_mask(fd, handler, write_mask, 0);
}

void multiplexer::unregister_reading(caf::net::socket_id fd) {
  update_mask(fd, nullptr, 0, read_mask);
}

void multiplexer::unregister_writing(caf::net::socket_id fd) {
  update_mask(fd, nullptr, 0, write_mask);
}

void multiplexer::deregister(caf::net::socket_id fd) {
  if (sockets_.erase(fd) > 0)
    log::multiplexer::debug("deregister-socket", "deregister socket {}", fd);
}

bool multiplexer::is_registered(caf::net::socket_id fd) const noexcept {
  return sockets_.count(fd) > 0;
}

// -- actions ------------------------------------------------------------------

multiplexer::action_id multiplexer::next_id() noexcept {
  return static_cast<action_id>(++last_id_);
}

multiplexer::action_id multiplexer::schedule(timestamp deadline, action f) {
  auto id = next_id();
  auto i = scheduled_.emplace(deadline, scheduled_action{id, std::move(f)});
  scheduled_index_.emplace(id, i);
  return id;
}

multiplexer::action_id multiplexer::post(action f) {
  auto id = next_id();
  posted_.emplace(id, std::move(f));
  return id;
}

bool multiplexer::cancel(action_id id) {
  if (posted_.erase(id) > 0)
    return true;
  if (auto i = scheduled_index_.find(id); i != scheduled_index_.end()) {
    scheduled_.erase(i->second);
    scheduled_index_.erase(i);
    return true;
  }
  return false;
}

std::optional<timestamp> multiplexer::next_deadline() const {
  if (scheduled_.empty())
    return std::nullopt;
  return scheduled_.begin()->first;
}

// -- running the loop ---------------------------------------------------------

void multiplexer::prepare_next_cycle() {
  polled_generation_ = last_generation_;
  fdset_.clear();
  fdset_.reserve(sockets_.size() + 1);
  fdset_.push_back({wakeup_rd_.id, read_mask, 0});
  for (const auto& [fd, reg] : sockets_)
    fdset_.push_back({fd, reg.events, 0});
}

int multiplexer::next_timeout(timespan max_wait) const {
  if (!posted_.empty())
    return 0;
  auto wait = max_wait;
  if (!scheduled_.empty()) {
    auto t = now();
    auto deadline = scheduled_.begin()->first;
    if (deadline <= t)
      return 0;
    wait = std::min(wait, timespan{deadline - t});
  }
  if (wait == infinite)
    return -1;
  if (wait <= timespan{0})
    return 0;
  // Round up. Waking up before the deadline would only cause another cycle.
  namespace sc = std::chrono;
  auto ms = sc::ceil<sc::milliseconds>(wait).count();
  return static_cast<int>(std::min<int64_t>(ms, INT_MAX));
}

void multiplexer::drain_wakeup_pipe() {
  std::byte buf[64];
  while (caf::net::read(wakeup_rd_, caf::byte_span{buf, sizeof(buf)}) > 0) {
    // nop
  }
}

void multiplexer::dispatch(const pollfd& entry) {
  if (entry.fd == wakeup_rd_.id) {
    drain_wakeup_pipe();
    return;
  }
  auto i = sockets_.find(entry.fd);
  if (i == sockets_.end() || i->second.generation > polled_generation_) {
    // Removed or registered anew since polling. The fd may be a reused number
    // for a different socket.
    return;
  }
  auto handler = i->second.handler;
  auto generation = i->second.generation;
  // Handlers may deregister themselves or replace the handler for their fd.
  // Hence, we check the registration again before each callback.
  auto current = [this, fd = entry.fd, handler,
                  generation]() -> registration* {
    auto j = sockets_.find(fd);
    if (j == sockets_.end() || j->second.handler != handler
        || j->second.generation != generation)
      return nullptr;
    return &j->second;
  };
  auto handled = false;
  if ((entry.revents & read_mask) && (entry.events & read_mask)) {
    handled = true;
    handler->handle_read_event();
  }
  if (auto reg = current();
      reg != nullptr && (entry.revents & (write_mask | error_mask))
      && (entry.events & write_mask) && (reg->events & write_mask)) {
    // Errors on a socket that waits for writing, e.g., a failed connect, show
    // up when trying to write.
    handled = true;
    handler->handle_write_event();
  }
  if (!handled && (entry.revents & error_mask) && current() != nullptr) {
    log::multiplexer::debug("socket-error", "poll reported an error for {}",
                            entry.fd);
    handler->handle_error(
      make_error(ec::socket_failure, "poll reported an error condition"));
  }
}

bool multiplexer::run_posted() {
  // Actions posted by other actions run in the next cycle.
  auto limit = static_cast<action_id>(last_id_ + 1);
  auto result = false;
  while (!posted_.empty() && posted_.begin()->first < limit) {
    auto i = posted_.begin();
    auto fn = std::move(i->second);
    posted_.erase(i);
    fn();
    result = true;
  }
  return result;
}

bool multiplexer::handle_timeouts() {
  auto t = now();
  auto limit = static_cast<action_id>(last_id_ + 1);
  auto result = false;
  auto i = scheduled_.begin();
  while (i != scheduled_.end() && i->first <= t) {
    if (i->second.id >= limit) {
      // Scheduled by an action in this pass: runs in the next cycle.
      ++i;
      continue;
    }
    auto fn = std::move(i->second.fn);
    scheduled_index_.erase(i->second.id);
    scheduled_.erase(i);
    fn();
    result = true;
    // The action may have modified the schedule.
    i = scheduled_.begin();
  }
  return result;
}

bool multiplexer::run_once(timespan max_wait) {
  prepare_next_cycle();
  auto timeout = next_timeout(max_wait);
  auto presult = ::poll(fdset_.data(), static_cast<nfds_t>(fdset_.size()),
                        timeout);
  auto result = false;
  if (presult < 0) {
    if (errno != EINTR) {
      log::multiplexer::critical("poll-failed", "poll() failed: {}",
                                 caf::net::last_socket_error_as_string());
      throw std::runtime_error("poll() failed");
    }
  } else if (presult > 0) {
    for (const auto& entry : fdset_) {
      if (entry.revents != 0) {
        dispatch(entry);
        result = true;
        if (--presult == 0)
          break;
      }
    }
  }
  if (run_posted())
    result = true;
  if (handle_timeouts())
    result = true;
  return result;
}

void multiplexer::run_for(timespan duration) {
  auto deadline = now() + duration;
  for (auto t = now(); t < deadline && !shutting_down(); t = now())
    run_once(deadline - t);
}

void multiplexer::run() {
  log::multiplexer::debug("run", "multiplexer starts running");
  while (!shutting_down())
    run_once();
  log::multiplexer::debug("done", "multiplexer stopped");
}

void multiplexer::shutdown() {
  if (shutting_down_.exchange(true))
    return;
  std::byte token{0};
  if (caf::net::write(wakeup_wr_, caf::const_byte_span{&token, 1}) < 0)
    log::multiplexer::warning("wakeup-failed",
                              "failed to wake up the multiplexer");
}

} // namespace gossamer
