#include "gossamer/format/bin.hh"

#include "gossamer/gossamer-test.test.hh"

#include "gossamer/message.hh"

#include <array>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace gossamer;
using namespace std::literals;

namespace {

template <class T>
auto do_encode(const T& value) {
  std::vector<std::byte> buf;
  if (!format::bin::v1::encode_to(buf, value))
    CAF_FAIL("serialization failed");
  return buf;
}

template <class T>
std::optional<T> do_decode(const std::vector<std::byte>& buf) {
  T result;
  if (format::bin::v1::decode_from(buf.data(), buf.data() + buf.size(),
                                   result))
    return result;
  return std::nullopt;
}

template <class... Ts>
std::vector<std::byte> bytes(Ts... xs) {
  return {static_cast<std::byte>(xs)...};
}

} // namespace

TEST(integers use network byte order) {
  CHECK_EQ(do_encode(uint8_t{0x12}), bytes(0x12));
  CHECK_EQ(do_encode(uint16_t{0x1234}), bytes(0x12, 0x34));
  CHECK_EQ(do_encode(uint32_t{0x12345678}), bytes(0x12, 0x34, 0x56, 0x78));
  CHECK_EQ(do_encode(int16_t{-2}), bytes(0xFF, 0xFE));
  CHECK_EQ(do_encode(true), bytes(1));
  CHECK_EQ(do_encode(false), bytes(0));
}

TEST(sizes use varbyte encoding) {
  CHECK_EQ(format::bin::v1::varbyte_size(0), 1u);
  CHECK_EQ(format::bin::v1::varbyte_size(127), 1u);
  CHECK_EQ(format::bin::v1::varbyte_size(128), 2u);
  CHECK_EQ(format::bin::v1::varbyte_size(16384), 3u);
  CHECK_EQ(do_encode("abc"s), bytes(3, 'a', 'b', 'c'));
  std::vector<std::byte> blob(200, std::byte{7});
  auto encoded = do_encode(blob);
  CHECK_EQ(encoded.size(), 202u);
  CHECK_EQ(encoded[0], std::byte{0xC8});
  CHECK_EQ(encoded[1], std::byte{0x01});
}

TEST(optionals and variants carry a tag byte) {
  CHECK_EQ(do_encode(std::optional<uint8_t>{}), bytes(0));
  CHECK_EQ(do_encode(std::optional<uint8_t>{5}), bytes(1, 5));
  using var = std::variant<uint8_t, uint16_t>;
  CHECK_EQ(do_encode(var{uint8_t{5}}), bytes(0, 5));
  CHECK_EQ(do_encode(var{uint16_t{5}}), bytes(1, 0, 5));
}

TEST(containers round trip) {
  std::vector<std::string> xs{"a", "bc", ""};
  CHECK(do_decode<std::vector<std::string>>(do_encode(xs)) == xs);
  std::vector<std::optional<uint16_t>> ys{std::nullopt, 7};
  CHECK_EQ(do_encode(ys), bytes(2, 0, 1, 0, 7));
  std::array<uint8_t, 3> arr{1, 2, 3};
  CHECK_EQ(do_encode(arr), bytes(1, 2, 3));
}

TEST(the decoder rejects malformed input) {
  MESSAGE("bools other than 0 and 1");
  CHECK(!do_decode<bool>(bytes(2)));
  MESSAGE("truncated integers");
  CHECK(!do_decode<uint32_t>(bytes(1, 2, 3)));
  MESSAGE("trailing bytes");
  CHECK(!do_decode<uint8_t>(bytes(1, 2)));
  MESSAGE("strings exceeding the input");
  CHECK(!do_decode<std::string>(bytes(5, 'a', 'b')));
  MESSAGE("lists that cannot fit into the input");
  CHECK(!do_decode<std::vector<uint8_t>>(bytes(0xFF, 0x7F, 1)));
  MESSAGE("varbytes with more than five groups");
  CHECK(!do_decode<std::string>(bytes(0x80, 0x80, 0x80, 0x80, 0x80, 0x00)));
  MESSAGE("unknown variant index");
  using var = std::variant<uint8_t, uint16_t>;
  CHECK(!do_decode<var>(bytes(2, 0)));
  MESSAGE("varbytes exceeding 32 bits");
  CHECK(!do_decode<std::string>(bytes(0xFF, 0xFF, 0xFF, 0xFF, 0x1F)));
}

TEST(gossip scopes reject unknown values) {
  CHECK(do_decode<gossip_scope>(bytes(1)) == gossip_scope::neighbors);
  CHECK(!do_decode<gossip_scope>(bytes(2)));
}

TEST(messages use a compact layout) {
  message msg;
  msg.topic[0] = std::byte{0xAA};
  msg.content = disconnect_msg{true, false};
  auto buf = do_encode(msg);
  REQUIRE_EQUAL(buf.size(), 32u + 3u);
  CHECK_EQ(buf[0], std::byte{0xAA});
  MESSAGE("index 5 selects the disconnect message");
  CHECK_EQ(buf[32], std::byte{5});
  CHECK_EQ(buf[33], std::byte{1});
  CHECK_EQ(buf[34], std::byte{0});
  auto decoded = do_decode<message>(buf);
  REQUIRE(decoded);
  CHECK(*decoded == msg);
}
