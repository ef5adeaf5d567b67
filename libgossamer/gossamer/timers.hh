#pragma once

#include "gossamer/logger.hh"
#include "gossamer/multiplexer.hh"
#include "gossamer/time.hh"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace gossamer {

/// Multiplexes any number of deadlines, each carrying a payload, into a single
/// wakeup on the ::multiplexer. At most one action is scheduled at any time:
/// the one for the earliest deadline.
///
/// Entries that share a deadline are drained together. Their relative order in
/// a batch is unspecified.
template <class T>
class timers {
public:
  // -- member types -----------------------------------------------------------

  using value_type = std::pair<timestamp, T>;

  /// All entries that became due with a single wakeup.
  using batch = std::vector<value_type>;

  using drain_handler = std::function<void(batch)>;

  // -- constructors, destructors, and assignment operators --------------------

  explicit timers(multiplexer& mpx) : mpx_(&mpx) {
    // nop
  }

  timers(const timers&) = delete;

  timers& operator=(const timers&) = delete;

  ~timers() {
    cancel_wakeup();
  }

  // -- properties -------------------------------------------------------------

  /// Returns the cached earliest deadline, if any.
  std::optional<timestamp> next_wake() const noexcept {
    return next_;
  }

  size_t size() const noexcept {
    return entries_.size();
  }

  bool empty() const noexcept {
    return entries_.empty();
  }

  /// Queries whether a handler waits for the next batch.
  bool waiting() const noexcept {
    return static_cast<bool>(handler_);
  }

  // -- modifiers --------------------------------------------------------------

  /// Adds `payload` with `deadline`. Recomputes the next wakeup if `deadline`
  /// is earlier than any other deadline.
  void insert(timestamp deadline, T payload) {
    entries_.emplace(deadline, std::move(payload));
    if (!next_ || deadline < *next_)
      reset();
  }

  /// Recomputes the next wakeup from the earliest deadline.
  void reset() {
    cancel_wakeup();
    if (entries_.empty()) {
      next_.reset();
      return;
    }
    next_ = entries_.begin()->first;
    if (handler_)
      arm();
  }

  /// Calls `f` with all due entries once the earliest deadline has passed.
  /// Without entries, `f` runs only after a subsequent `insert` and the
  /// deadline of that entry. Replaces any previously registered handler.
  /// @note `f` runs at most once. Call `wait_and_drain` again from `f` to
  ///       receive the next batch.
  void wait_and_drain(drain_handler f) {
    handler_ = std::move(f);
    if (next_ && wakeup_ == multiplexer::invalid_action_id)
      arm();
  }

  /// Drops the handler registered with `wait_and_drain`.
  void cancel_wait() {
    handler_ = nullptr;
    cancel_wakeup();
  }

  /// Removes and returns all entries with a deadline of `t` or earlier.
  batch drain_until(timestamp t) {
    batch result;
    auto last = entries_.upper_bound(t);
    for (auto i = entries_.begin(); i != last; ++i)
      result.emplace_back(i->first, std::move(i->second));
    entries_.erase(entries_.begin(), last);
    reset();
    return result;
  }

private:
  void arm() {
    wakeup_ = mpx_->schedule(*next_, [this] { fire(); });
  }

  void cancel_wakeup() {
    if (wakeup_ != multiplexer::invalid_action_id) {
      mpx_->cancel(wakeup_);
      wakeup_ = multiplexer::invalid_action_id;
    }
  }

  void fire() {
    wakeup_ = multiplexer::invalid_action_id;
    auto f = std::move(handler_);
    handler_ = nullptr;
    // Entries with past deadlines belong in this batch as well.
    auto cutoff = std::max(mpx_->now(), *next_);
    auto result = drain_until(cutoff);
    log::timers::debug("drain", "drained {} entries, {} remaining",
                       result.size(), entries_.size());
    if (f)
      f(std::move(result));
  }

  multiplexer* mpx_;

  std::multimap<timestamp, T> entries_;

  std::optional<timestamp> next_;

  multiplexer::action_id wakeup_ = multiplexer::invalid_action_id;

  drain_handler handler_;
};

} // namespace gossamer
