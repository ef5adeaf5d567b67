#pragma once

#include "gossamer/multiplexer.hh"
#include "gossamer/peer_id.hh"
#include "gossamer/transport.hh"

#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gossamer {

/// Identifies a single connect attempt of a ::dialer. Attempts to the same peer
/// get distinct IDs, which allows callers to tell the result of a cancelled
/// attempt apart from the result of a later attempt.
enum class dial_attempt_id : uint64_t {};

/// @relates dial_attempt_id
inline std::string to_string(dial_attempt_id x) {
  return std::to_string(static_cast<uint64_t>(x));
}

/// The outcome of a dial.
struct dial_result {
  peer_id peer;
  dial_attempt_id attempt;
  caf::expected<connection_ptr> value;
};

/// Maintains a set of outbound connection attempts, at most one per peer, and
/// reports their outcomes in completion order.
class dialer {
public:
  // -- member types -----------------------------------------------------------

  using result_handler = std::function<void(dial_result)>;

  // -- constructors, destructors, and assignment operators --------------------

  dialer(multiplexer& mpx, transport_ptr tr);

  dialer(const dialer&) = delete;

  dialer& operator=(const dialer&) = delete;

  /// Abandons all outstanding attempts.
  ~dialer();

  // -- properties -------------------------------------------------------------

  /// Queries whether `peer` has a pending attempt.
  bool is_pending(const peer_id& peer) const noexcept {
    return pending_.count(peer) > 0;
  }

  /// Returns the attempt ID for `peer` if it has a pending attempt.
  std::optional<dial_attempt_id> pending_attempt(const peer_id& peer) const;

  /// Returns the number of peers with a pending attempt.
  size_t num_pending() const noexcept {
    return pending_.size();
  }

  /// Returns the number of attempts that wait for the transport, including
  /// none that were cancelled already.
  size_t num_in_flight() const noexcept {
    return in_flight_.size();
  }

  /// Returns the number of results that wait for `next` or `try_next`.
  size_t num_completed() const noexcept {
    return completed_.size();
  }

  /// Queries whether `next` eventually produces a result without any new call
  /// to `queue_dial`.
  bool has_work() const noexcept {
    return !pending_.empty();
  }

  // -- dialing ----------------------------------------------------------------

  /// Starts connecting to `peer` for `protocol` unless `peer` already has a
  /// pending attempt.
  /// @returns the ID of the new attempt or of the already pending attempt.
  dial_attempt_id queue_dial(const peer_id& peer, std::string_view protocol);

  /// Cancels the pending attempt for `peer`, if any. The peer is no longer
  /// pending after this call. The cancelled attempt still produces a result
  /// with `ec::dial_cancelled`.
  void abort_dial(const peer_id& peer);

  // -- results ----------------------------------------------------------------

  /// Calls `f` with the next completed attempt. If no peer is pending at the
  /// time of the call, `f` does not run until the next call to `queue_dial`
  /// starts a new attempt, even if results of aborted attempts are queued.
  /// Those results get delivered first once a new attempt starts. Replaces any
  /// previously registered handler.
  /// @note `f` runs at most once and always from a multiplexer action.
  void next(result_handler f);

  /// Drops the handler registered with `next`.
  void cancel_next();

  /// Returns the next completed attempt if one is available.
  std::optional<dial_result> try_next();

private:
  struct pending_dial {
    dial_attempt_id id;
  };

  struct in_flight_dial {
    peer_id peer;
    connect_handle handle;
  };

  void complete(dial_attempt_id id, caf::expected<connection_ptr> result);

  void schedule_delivery();

  void deliver();

  multiplexer* mpx_;

  transport_ptr transport_;

  std::unordered_map<peer_id, pending_dial> pending_;

  std::unordered_map<dial_attempt_id, in_flight_dial> in_flight_;

  std::deque<dial_result> completed_;

  result_handler handler_;

  /// Set while `handler_` may receive results. Only becomes true while some
  /// peer is pending.
  bool armed_ = false;

  multiplexer::action_id delivery_ = multiplexer::invalid_action_id;

  uint64_t last_attempt_ = 0;
};

} // namespace gossamer
