#include "gossamer/message.hh"

#include "gossamer/gossamer-test.test.hh"

#include "gossamer/format.hh"

#include <format>

using namespace gossamer;

TEST(messages render their kind and topic) {
  message msg;
  msg.topic[0] = std::byte{0xDE};
  msg.topic[1] = std::byte{0xAD};
  msg.content = prune_msg{};
  CHECK_EQ(to_string(msg), "prune(topic=dead0000)");
  msg.content = ihave_msg{};
  CHECK_EQ(std::format("{}", msg), "ihave(topic=dead0000)");
}

TEST(kind names follow the variant order) {
  CHECK(kind_name(join_msg{}) == "join");
  CHECK(kind_name(forward_join_msg{}) == "forward_join");
  CHECK(kind_name(shuffle_reply_msg{}) == "shuffle_reply");
  CHECK(kind_name(gossip_msg{}) == "gossip");
  CHECK(kind_name(graft_msg{}) == "graft");
}

TEST(messages compare by value) {
  message a;
  a.content = gossip_msg{message_id{}, payload{std::byte{1}},
                         gossip_scope::swarm};
  auto b = a;
  CHECK(a == b);
  std::get<gossip_msg>(b.content).scope = gossip_scope::neighbors;
  CHECK(!(a == b));
  b = a;
  b.topic[3] = std::byte{1};
  CHECK(a != b);
}
