#include "gossamer/event_observer.hh"

namespace gossamer {

event_observer::~event_observer() {}

} // namespace gossamer
