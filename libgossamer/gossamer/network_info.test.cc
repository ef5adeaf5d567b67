#include "gossamer/network_info.hh"

#include "gossamer/gossamer-test.test.hh"

#include <optional>

using namespace gossamer;

namespace {

std::optional<network_info> parse(std::string_view str) {
  network_info result;
  if (convert(str, result))
    return result;
  return std::nullopt;
}

} // namespace

TEST(network_info renders as host and port) {
  CHECK_EQ(to_string(network_info{"127.0.0.1", 4040}), "127.0.0.1:4040");
  CHECK_EQ(to_string(network_info{"example.com", 80}), "example.com:80");
  CHECK_EQ(to_string(network_info{"::1", 4040}), "[::1]:4040");
}

TEST(network_info parses host and port) {
  CHECK(parse("127.0.0.1:4040") == network_info("127.0.0.1", 4040));
  CHECK(parse("localhost:1") == network_info("localhost", 1));
  CHECK(parse("[::1]:4040") == network_info("::1", 4040));
  CHECK(!parse("::1:4040"));
  CHECK(!parse("localhost"));
  CHECK(!parse("localhost:"));
  CHECK(!parse(":80"));
  CHECK(!parse("localhost:70000"));
  CHECK(!parse("localhost:80x"));
  CHECK(!parse("[]:80"));
}

TEST(network_info compares address first) {
  CHECK_LESS(network_info("a", 9), network_info("b", 1));
  CHECK_LESS(network_info("a", 1), network_info("a", 2));
  CHECK_EQ(network_info("a", 1), network_info("a", 1));
}
