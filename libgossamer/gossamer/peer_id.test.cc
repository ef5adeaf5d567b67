#include "gossamer/peer_id.hh"

#include "gossamer/gossamer-test.test.hh"

#include <unordered_set>

using namespace gossamer;

TEST(default-constructed IDs are invalid) {
  peer_id id;
  CHECK(!id.valid());
  CHECK(!id);
  CHECK_EQ(id, peer_id::nil());
  CHECK_EQ(to_string(id), std::string(64, '0'));
}

TEST(random IDs are valid and distinct) {
  auto a = peer_id::random();
  auto b = peer_id::random();
  CHECK(a.valid());
  CHECK(b.valid());
  CHECK_NOT_EQUAL(a, b);
  CHECK_EQ(peer_id::random(7), peer_id::random(7));
  CHECK_NOT_EQUAL(peer_id::random(7), peer_id::random(8));
}

TEST(IDs render as lowercase hex) {
  peer_id::array_type bytes{};
  bytes[0] = std::byte{0xAB};
  bytes[1] = std::byte{0x01};
  bytes[31] = std::byte{0xFF};
  peer_id id{bytes};
  auto str = to_string(id);
  CHECK_EQ(str.size(), 64u);
  CHECK_EQ(str.substr(0, 4), "ab01");
  CHECK_EQ(str.substr(62), "ff");
  CHECK_EQ(id.short_string(), "ab01000000");
}

TEST(IDs parse from their string representation) {
  auto id = peer_id::random(42);
  peer_id parsed;
  CHECK(convert(to_string(id), parsed));
  CHECK_EQ(parsed, id);
  CHECK(peer_id::can_parse(to_string(id)));
  CHECK(!peer_id::can_parse("abc"));
  CHECK(!peer_id::can_parse(std::string(64, 'x')));
  CHECK(!peer_id::can_parse(std::string(66, '0')));
}

TEST(IDs are usable as hash keys) {
  std::unordered_set<peer_id> ids;
  ids.insert(peer_id::random(1));
  ids.insert(peer_id::random(2));
  ids.insert(peer_id::random(1));
  CHECK_EQ(ids.size(), 2u);
}
