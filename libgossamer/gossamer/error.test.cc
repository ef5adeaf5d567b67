#include "gossamer/error.hh"

#include "gossamer/gossamer-test.test.hh"

#include "gossamer/format.hh"

#include <caf/sec.hpp>

#include <format>

using namespace gossamer;

TEST(error codes convert to and from strings) {
  CHECK_EQ(to_string(ec::dial_cancelled), "dial_cancelled");
  CHECK_EQ(to_string(ec::frame_too_large), "frame_too_large");
  ec code = ec::none;
  CHECK(convert("truncated_frame", code));
  CHECK_EQ(code, ec::truncated_frame);
  CHECK(!convert("no_such_code", code));
  CHECK_EQ(code, ec::truncated_frame);
  CHECK(from_integer(static_cast<uint8_t>(ec::logic_error), code));
  CHECK_EQ(code, ec::logic_error);
  CHECK(!from_integer(200, code));
}

TEST(errors carry an optional description) {
  auto err = make_error(ec::unknown_peer, "no address for peer abc");
  CHECK_EQ(code_of(err), ec::unknown_peer);
  CHECK_EQ(std::format("{}", err), "unknown_peer: no address for peer abc");
  CHECK_EQ(std::format("{}", make_error(ec::connect_timeout)),
           "connect_timeout");
  CHECK_EQ(std::format("{}", caf::error{}), "none");
}

TEST(code_of maps foreign errors to unspecified) {
  CHECK_EQ(code_of(caf::make_error(caf::sec::runtime_error)), ec::unspecified);
  CHECK_EQ(code_of(caf::error{}), ec::none);
}
