#include "gossamer/dialer.hh"

#include "gossamer/detail/assert.hh"
#include "gossamer/error.hh"
#include "gossamer/format.hh"
#include "gossamer/logger.hh"

#include <utility>

namespace gossamer {

// -- constructors, destructors, and assignment operators ----------------------

dialer::dialer(multiplexer& mpx, transport_ptr tr)
  : mpx_(&mpx), transport_(std::move(tr)) {
  GOSSAMER_ASSERT(transport_ != nullptr);
}

dialer::~dialer() {
  if (delivery_ != multiplexer::invalid_action_id)
    mpx_->cancel(delivery_);
  for (auto& [id, attempt] : in_flight_)
    attempt.handle.dispose();
}

// -- properties ---------------------------------------------------------------

std::optional<dial_attempt_id>
dialer::pending_attempt(const peer_id& peer) const {
  if (auto i = pending_.find(peer); i != pending_.end())
    return i->second.id;
  return std::nullopt;
}

// -- dialing ------------------------------------------------------------------

dial_attempt_id dialer::queue_dial(const peer_id& peer,
                                   std::string_view protocol) {
  if (auto i = pending_.find(peer); i != pending_.end()) {
    log::dialer::debug("duplicate-dial", "peer {} already has a pending dial",
                       peer.short_string());
    return i->second.id;
  }
  auto id = static_cast<dial_attempt_id>(++last_attempt_);
  log::dialer::debug("queue-dial", "dial peer {} for {} (attempt {})",
                     peer.short_string(), protocol, to_string(id));
  pending_.emplace(peer, pending_dial{id});
  auto& attempt = in_flight_[id];
  attempt.peer = peer;
  // The transport never calls the callback before async_connect returns.
  // Hence, the entry in in_flight_ exists by the time the callback runs.
  attempt.handle = transport_->async_connect(
    peer, protocol, [this, id](caf::expected<connection_ptr> res) {
      complete(id, std::move(res));
    });
  if (handler_ && !armed_) {
    armed_ = true;
    schedule_delivery();
  }
  return id;
}

void dialer::abort_dial(const peer_id& peer) {
  auto i = pending_.find(peer);
  if (i == pending_.end())
    return;
  auto id = i->second.id;
  pending_.erase(i);
  log::dialer::debug("abort-dial", "abort dial to peer {} (attempt {})",
                     peer.short_string(), to_string(id));
  complete(id, make_error(ec::dial_cancelled, "dial aborted by the caller"));
}

void dialer::complete(dial_attempt_id id,
                      caf::expected<connection_ptr> result) {
  auto i = in_flight_.find(id);
  if (i == in_flight_.end()) {
    // Late result of an attempt that has been resolved already.
    return;
  }
  auto peer = i->second.peer;
  // Disposing a handle that already produced its result has no effect.
  i->second.handle.dispose();
  in_flight_.erase(i);
  if (auto j = pending_.find(peer); j != pending_.end() && j->second.id == id)
    pending_.erase(j);
  if (result) {
    log::dialer::verbose("dial-succeeded", "connected to peer {} (attempt {})",
                         peer.short_string(), to_string(id));
  } else {
    log::dialer::verbose("dial-failed", "dial to peer {} failed: {}",
                         peer.short_string(), result.error());
  }
  completed_.push_back(dial_result{peer, id, std::move(result)});
  schedule_delivery();
}

// -- results ------------------------------------------------------------------

void dialer::next(result_handler f) {
  handler_ = std::move(f);
  armed_ = !pending_.empty();
  if (!armed_)
    log::dialer::debug("idle-next", "no pending dial, holding {} result(s)",
                       completed_.size());
  schedule_delivery();
}

void dialer::cancel_next() {
  handler_ = nullptr;
  armed_ = false;
  if (delivery_ != multiplexer::invalid_action_id) {
    mpx_->cancel(delivery_);
    delivery_ = multiplexer::invalid_action_id;
  }
}

std::optional<dial_result> dialer::try_next() {
  if (completed_.empty())
    return std::nullopt;
  auto result = std::move(completed_.front());
  completed_.pop_front();
  return result;
}

void dialer::schedule_delivery() {
  if (!handler_ || !armed_ || completed_.empty()
      || delivery_ != multiplexer::invalid_action_id)
    return;
  delivery_ = mpx_->post([this] { deliver(); });
}

void dialer::deliver() {
  delivery_ = multiplexer::invalid_action_id;
  if (!handler_ || !armed_ || completed_.empty())
    return;
  auto f = std::move(handler_);
  handler_ = nullptr;
  armed_ = false;
  auto result = std::move(completed_.front());
  completed_.pop_front();
  f(std::move(result));
}

} // namespace gossamer
