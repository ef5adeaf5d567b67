#pragma once

#include "gossamer/time.hh"

#include <caf/error.hpp>
#include <caf/net/pipe_socket.hpp>
#include <caf/net/socket_id.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <poll.h>

namespace gossamer {

/// Receives I/O events from a ::multiplexer.
class socket_handler {
public:
  virtual ~socket_handler();

  /// Called when the socket has data available or the peer closed it.
  virtual void handle_read_event() = 0;

  /// Called when the socket accepts more data, e.g., after a non-blocking
  /// connect finished.
  virtual void handle_write_event() = 0;

  /// Called when polling reports an error condition for the socket without
  /// it being readable or writable.
  virtual void handle_error(const caf::error& reason) = 0;
};

/// A single-threaded reactor that dispatches socket events and runs timed or
/// posted actions. All gossamer components that wait for something (dials,
/// timers, frames) do so by registering with a multiplexer. The multiplexer
/// itself never calls into a component while the component's own member
/// function is running: completions always arrive through a posted or
/// scheduled action.
class multiplexer {
public:
  // -- member types -----------------------------------------------------------

  using action = std::function<void()>;

  /// Identifies a scheduled or posted action.
  enum class action_id : uint64_t {};

  static constexpr auto invalid_action_id = action_id{0};

  // -- constructors, destructors, and assignment operators --------------------

  /// @throws std::runtime_error if the multiplexer fails to create its wakeup
  ///         pipe.
  multiplexer();

  multiplexer(const multiplexer&) = delete;

  multiplexer& operator=(const multiplexer&) = delete;

  ~multiplexer();

  // -- time -------------------------------------------------------------------

  /// Returns the current time on the monotonic clock.
  timestamp now() const {
    return gossamer::now();
  }

  // -- socket management ------------------------------------------------------

  /// Starts polling `fd` for reading. Calls `handler` on events.
  /// @pre `handler` stays valid until calling `deregister(fd)`.
  /// @note Registrations made while dispatching events take effect with the
  ///       next poll. Removals take effect immediately.
  void register_reading(caf::net::socket_id fd, socket_handler* handler);

  /// Starts polling `fd` for writing. Calls `handler` on events.
  /// @pre `handler` stays valid until calling `deregister(fd)`.
  void register_writing(caf::net::socket_id fd, socket_handler* handler);

  /// Stops polling `fd` for reading.
  void unregister_reading(caf::net::socket_id fd);

  /// Stops polling `fd` for writing.
  void unregister_writing(caf::net::socket_id fd);

  /// Stops polling `fd` and forgets its handler.
  void deregister(caf::net::socket_id fd);

  /// Queries whether the multiplexer polls `fd`.
  bool is_registered(caf::net::socket_id fd) const noexcept;

  /// Returns the number of sockets the multiplexer polls.
  size_t num_sockets() const noexcept {
    return sockets_.size();
  }

  // -- actions ----------------------------------------------------------------

  /// Runs `f` once `deadline` has passed.
  action_id schedule(timestamp deadline, action f);

  /// Runs `f` once `delay` has passed.
  action_id schedule_after(timespan delay, action f) {
    return schedule(now() + delay, std::move(f));
  }

  /// Runs `f` in the next iteration of the loop.
  action_id post(action f);

  /// Cancels a scheduled or posted action.
  /// @returns `true` if the action was still pending, `false` otherwise.
  bool cancel(action_id id);

  /// Returns the number of scheduled actions, not counting posted ones.
  size_t num_scheduled() const noexcept {
    return scheduled_.size();
  }

  /// Returns the number of posted actions.
  size_t num_posted() const noexcept {
    return posted_.size();
  }

  /// Returns the deadline of the next scheduled action, if any.
  std::optional<timestamp> next_deadline() const;

  // -- running the loop -------------------------------------------------------

  /// Polls for I/O for at most `max_wait`, then dispatches events, posted
  /// actions and expired timeouts.
  /// @returns `true` if any event or action was processed.
  /// @throws std::runtime_error if polling fails.
  bool run_once(timespan max_wait = infinite);

  /// Runs the loop until `duration` has passed or until calling `shutdown`.
  void run_for(timespan duration);

  /// Runs the loop until `pred` returns `true` or `timeout` has passed.
  /// @returns `pred()` after running the loop.
  template <class Predicate>
  bool run_until(Predicate pred, timespan timeout) {
    auto deadline = now() + timeout;
    while (!pred()) {
      auto t = now();
      if (t >= deadline || shutting_down())
        return pred();
      run_once(deadline - t);
    }
    return true;
  }

  /// Runs the loop until calling `shutdown`.
  void run();

  /// Stops `run`, `run_for` and `run_until`. Safe to call from any thread.
  void shutdown();

  /// Queries whether `shutdown` has been called.
  bool shutting_down() const noexcept {
    return shutting_down_.load();
  }

private:
  struct registration {
    socket_handler* handler = nullptr;
    short events = 0;
    /// Changes whenever `fd` gets a new handler. Events polled for an older
    /// generation never reach the new handler.
    uint64_t generation = 0;
  };

  struct scheduled_action {
    action_id id;
    action fn;
  };

  using schedule_map = std::multimap<timestamp, scheduled_action>;

  action_id next_id() noexcept;

  void update_mask(caf::net::socket_id fd, socket_handler* handler,
                   short add_mask, short del_mask);

  void prepare_next_cycle();

  int next_timeout(timespan max_wait) const;

  void dispatch(const pollfd& entry);

  void drain_wakeup_pipe();

  bool run_posted();

  bool handle_timeouts();

  std::unordered_map<caf::net::socket_id, registration> sockets_;

  uint64_t last_generation_ = 0;

  /// The newest generation included in the current poll set.
  uint64_t polled_generation_ = 0;

  std::vector<pollfd> fdset_;

  schedule_map scheduled_;

  std::unordered_map<action_id, schedule_map::iterator> scheduled_index_;

  std::map<action_id, action> posted_;

  uint64_t last_id_ = 0;

  caf::net::pipe_socket wakeup_rd_;

  caf::net::pipe_socket wakeup_wr_;

  std::atomic<bool> shutting_down_{false};
};

/// @relates multiplexer::action_id
inline std::string to_string(multiplexer::action_id x) {
  return std::to_string(static_cast<uint64_t>(x));
}

} // namespace gossamer
