#include "gossamer/transport.hh"

#include "gossamer/error.hh"

namespace gossamer {

connection::~connection() {
  // nop
}

caf::expected<std::unique_ptr<message_channel>>
connection::open_channel(multiplexer&, message_channel::listener*) {
  return make_error(ec::stream_unavailable,
                    "the connection cannot run a message channel");
}

transport::~transport() {
  // nop
}

} // namespace gossamer
