#include "gossamer/message.hh"

#include <iterator>
#include <tuple>
#include <variant>

namespace gossamer {

// -- comparison ---------------------------------------------------------------

bool operator==(const peer_info& lhs, const peer_info& rhs) noexcept {
  return lhs.id == rhs.id && lhs.data == rhs.data;
}

bool operator==(const join_msg& lhs, const join_msg& rhs) noexcept {
  return lhs.origin == rhs.origin;
}

bool operator==(const forward_join_msg& lhs,
                const forward_join_msg& rhs) noexcept {
  return lhs.origin == rhs.origin && lhs.ttl == rhs.ttl;
}

bool operator==(const shuffle_msg& lhs, const shuffle_msg& rhs) noexcept {
  return lhs.origin == rhs.origin && lhs.nodes == rhs.nodes
         && lhs.ttl == rhs.ttl;
}

bool operator==(const shuffle_reply_msg& lhs,
                const shuffle_reply_msg& rhs) noexcept {
  return lhs.nodes == rhs.nodes;
}

bool operator==(const neighbor_msg& lhs, const neighbor_msg& rhs) noexcept {
  return lhs.high_priority == rhs.high_priority && lhs.data == rhs.data;
}

bool operator==(const disconnect_msg& lhs, const disconnect_msg& rhs) noexcept {
  return std::tie(lhs.alive, lhs.respond) == std::tie(rhs.alive, rhs.respond);
}

bool operator==(const gossip_msg& lhs, const gossip_msg& rhs) noexcept {
  return lhs.id == rhs.id && lhs.content == rhs.content
         && lhs.scope == rhs.scope;
}

bool operator==(const ihave_entry& lhs, const ihave_entry& rhs) noexcept {
  return lhs.id == rhs.id && lhs.round == rhs.round;
}

bool operator==(const ihave_msg& lhs, const ihave_msg& rhs) noexcept {
  return lhs.entries == rhs.entries;
}

bool operator==(const graft_msg& lhs, const graft_msg& rhs) noexcept {
  return lhs.id == rhs.id && lhs.round == rhs.round;
}

bool operator==(const prune_msg&, const prune_msg&) noexcept {
  return true;
}

bool operator==(const message& lhs, const message& rhs) noexcept {
  return lhs.topic == rhs.topic && lhs.content == rhs.content;
}

// -- conversion ---------------------------------------------------------------

namespace {

constexpr std::string_view kind_names[] = {
  "join",   "forward_join", "shuffle", "shuffle_reply", "neighbor",
  "disconnect", "gossip",   "ihave",   "graft",         "prune",
};

static_assert(std::size(kind_names) == std::variant_size_v<message_content>);

} // namespace

std::string_view kind_name(const message_content& x) noexcept {
  return kind_names[x.index()];
}

void convert(const message& x, std::string& str) {
  constexpr const char* tbl = "0123456789abcdef";
  str = kind_name(x.content);
  str += "(topic=";
  // The first four bytes suffice to tell topics apart in log output.
  for (size_t index = 0; index < 4; ++index) {
    auto val = static_cast<uint8_t>(x.topic[index]);
    str += tbl[val >> 4];
    str += tbl[val & 0x0F];
  }
  str += ')';
}

std::string to_string(const message& x) {
  std::string result;
  convert(x, result);
  return result;
}

} // namespace gossamer
