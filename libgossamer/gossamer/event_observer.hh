#pragma once

#include "gossamer/event.hh"

#include <memory>

namespace gossamer {

/// Receives the log events of dialers, transports, timers and channels.
class event_observer {
public:
  virtual ~event_observer();

  /// Consumes `what`. Each multiplexer runs in its own thread, so
  /// implementations must synchronize access to shared state.
  virtual void observe(event_ptr what) = 0;

  /// Filters events before they get formatted. Components skip building the
  /// description of events for which this returns `false`.
  virtual bool accepts(event::severity_level severity,
                       event::component_type component) const = 0;
};

using event_observer_ptr = std::shared_ptr<event_observer>;

} // namespace gossamer
