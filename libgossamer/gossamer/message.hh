#pragma once

#include "gossamer/peer_id.hh"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gossamer {

// -- identifiers and aliases --------------------------------------------------

/// Identifies a gossip swarm.
using topic_id = std::array<std::byte, 32>;

/// Content hash of a gossip message.
using message_id = std::array<std::byte, 32>;

/// Opaque payload bytes.
using payload = std::vector<std::byte>;

/// Number of hops a gossip message has traveled.
using gossip_round = uint16_t;

/// Time-to-live counter for forwarded membership requests.
using ttl_t = uint16_t;

/// A peer together with the opaque data it advertises, e.g., its addresses.
struct peer_info {
  peer_id id;
  payload data;
};

template <class Inspector>
bool inspect(Inspector& f, peer_info& x) {
  return f.object(x).fields(f.field("id", x.id), f.field("data", x.data));
}

// -- membership messages ------------------------------------------------------

/// Asks the receiver to add the sender to its active view.
struct join_msg {
  peer_info origin;
};

template <class Inspector>
bool inspect(Inspector& f, join_msg& x) {
  return f.object(x).fields(f.field("origin", x.origin));
}

/// Forwards a join request through the swarm.
struct forward_join_msg {
  peer_info origin;
  ttl_t ttl = 0;
};

template <class Inspector>
bool inspect(Inspector& f, forward_join_msg& x) {
  return f.object(x).fields(f.field("origin", x.origin),
                            f.field("ttl", x.ttl));
}

/// Exchanges a random sample of known peers.
struct shuffle_msg {
  peer_id origin;
  std::vector<peer_info> nodes;
  ttl_t ttl = 0;
};

template <class Inspector>
bool inspect(Inspector& f, shuffle_msg& x) {
  return f.object(x).fields(f.field("origin", x.origin),
                            f.field("nodes", x.nodes), f.field("ttl", x.ttl));
}

/// Answers a shuffle request.
struct shuffle_reply_msg {
  std::vector<peer_info> nodes;
};

template <class Inspector>
bool inspect(Inspector& f, shuffle_reply_msg& x) {
  return f.object(x).fields(f.field("nodes", x.nodes));
}

/// Asks the receiver to become a neighbor of the sender.
struct neighbor_msg {
  /// A high-priority request must not be rejected, e.g., because the sender
  /// has no other neighbors.
  bool high_priority = false;
  payload data;
};

template <class Inspector>
bool inspect(Inspector& f, neighbor_msg& x) {
  return f.object(x).fields(f.field("high_priority", x.high_priority),
                            f.field("data", x.data));
}

/// Removes the sender from the receiver's active view.
struct disconnect_msg {
  /// Whether the sender remains reachable.
  bool alive = false;
  /// Whether the receiver should answer with a disconnect of its own.
  bool respond = false;
};

template <class Inspector>
bool inspect(Inspector& f, disconnect_msg& x) {
  return f.object(x).fields(f.field("alive", x.alive),
                            f.field("respond", x.respond));
}

// -- broadcast messages -------------------------------------------------------

/// Selects who receives a broadcast.
enum class gossip_scope : uint8_t {
  /// The message travels through the whole swarm.
  swarm,
  /// The message stays with the direct neighbors of the sender.
  neighbors,
};

template <class Inspector>
bool inspect(Inspector& f, gossip_scope& x) {
  auto get = [&x] { return static_cast<uint8_t>(x); };
  auto set = [&x](uint8_t val) {
    if (val > static_cast<uint8_t>(gossip_scope::neighbors))
      return false;
    x = static_cast<gossip_scope>(val);
    return true;
  };
  return f.apply(get, set);
}

/// Carries an application payload through the swarm.
struct gossip_msg {
  message_id id = {};
  payload content;
  gossip_scope scope = gossip_scope::swarm;
};

template <class Inspector>
bool inspect(Inspector& f, gossip_msg& x) {
  return f.object(x).fields(f.field("id", x.id), f.field("content", x.content),
                            f.field("scope", x.scope));
}

/// Announces a message the sender has received.
struct ihave_entry {
  message_id id = {};
  gossip_round round = 0;
};

template <class Inspector>
bool inspect(Inspector& f, ihave_entry& x) {
  return f.object(x).fields(f.field("id", x.id), f.field("round", x.round));
}

/// Lazily announces received messages instead of pushing their content.
struct ihave_msg {
  std::vector<ihave_entry> entries;
};

template <class Inspector>
bool inspect(Inspector& f, ihave_msg& x) {
  return f.object(x).fields(f.field("entries", x.entries));
}

/// Asks the receiver to push messages eagerly again, optionally requesting a
/// specific message.
struct graft_msg {
  std::optional<message_id> id;
  gossip_round round = 0;
};

template <class Inspector>
bool inspect(Inspector& f, graft_msg& x) {
  return f.object(x).fields(f.field("id", x.id), f.field("round", x.round));
}

/// Asks the receiver to stop pushing messages eagerly.
struct prune_msg {};

template <class Inspector>
bool inspect(Inspector& f, prune_msg& x) {
  return f.object(x).fields();
}

// -- the protocol message -----------------------------------------------------

using message_content =
  std::variant<join_msg, forward_join_msg, shuffle_msg, shuffle_reply_msg,
               neighbor_msg, disconnect_msg, gossip_msg, ihave_msg, graft_msg,
               prune_msg>;

/// A message on the wire: the swarm it belongs to plus one of the membership
/// or broadcast messages.
struct message {
  topic_id topic = {};
  message_content content;
};

template <class Inspector>
bool inspect(Inspector& f, message& x) {
  return f.object(x).fields(f.field("topic", x.topic),
                            f.field("content", x.content));
}

// -- comparison ---------------------------------------------------------------

bool operator==(const peer_info& lhs, const peer_info& rhs) noexcept;
bool operator==(const join_msg& lhs, const join_msg& rhs) noexcept;
bool operator==(const forward_join_msg& lhs,
                const forward_join_msg& rhs) noexcept;
bool operator==(const shuffle_msg& lhs, const shuffle_msg& rhs) noexcept;
bool operator==(const shuffle_reply_msg& lhs,
                const shuffle_reply_msg& rhs) noexcept;
bool operator==(const neighbor_msg& lhs, const neighbor_msg& rhs) noexcept;
bool operator==(const disconnect_msg& lhs, const disconnect_msg& rhs) noexcept;
bool operator==(const gossip_msg& lhs, const gossip_msg& rhs) noexcept;
bool operator==(const ihave_entry& lhs, const ihave_entry& rhs) noexcept;
bool operator==(const ihave_msg& lhs, const ihave_msg& rhs) noexcept;
bool operator==(const graft_msg& lhs, const graft_msg& rhs) noexcept;
bool operator==(const prune_msg& lhs, const prune_msg& rhs) noexcept;
bool operator==(const message& lhs, const message& rhs) noexcept;

// -- conversion ---------------------------------------------------------------

/// Returns the name of the active alternative in `x`, e.g., "gossip".
std::string_view kind_name(const message_content& x) noexcept;

/// Renders a short description of `x` for log output.
void convert(const message& x, std::string& str);

/// @relates message
std::string to_string(const message& x);

} // namespace gossamer
