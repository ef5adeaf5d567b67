#include "gossamer/peer_id.hh"

#include <caf/hash/fnv.hpp>

#include <cstdint>
#include <random>

namespace gossamer {

namespace {

constexpr std::byte nil_bytes[peer_id::num_bytes] = {};

template <class RandomEngine>
peer_id make_random_id(RandomEngine& engine) {
  std::uniform_int_distribution<unsigned> dist{0, 255};
  peer_id::array_type bytes;
  for (auto& x : bytes)
    x = static_cast<std::byte>(dist(engine));
  return peer_id{bytes};
}

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

peer_id::peer_id() noexcept {
  memset(bytes_.data(), 0, bytes_.size());
}

bool peer_id::valid() const noexcept {
  return memcmp(bytes_.data(), nil_bytes, num_bytes) != 0;
}

size_t peer_id::hash() const noexcept {
  return caf::hash::fnv<size_t>::compute(bytes_);
}

std::string peer_id::short_string() const {
  auto str = to_string(*this);
  str.resize(short_string_size);
  return str;
}

peer_id peer_id::random() {
  std::random_device device;
  std::mt19937_64 engine{device()};
  return make_random_id(engine);
}

peer_id peer_id::random(unsigned seed) {
  std::mt19937_64 engine{seed};
  return make_random_id(engine);
}

bool peer_id::can_parse(std::string_view str) {
  peer_id tmp;
  return convert(str, tmp);
}

// -- free functions -----------------------------------------------------------

void convert(const peer_id& x, std::string& str) {
  constexpr const char* tbl = "0123456789abcdef";
  str.clear();
  str.reserve(peer_id::num_bytes * 2);
  for (auto b : x.bytes()) {
    auto val = static_cast<uint8_t>(b);
    str += tbl[val >> 4];
    str += tbl[val & 0x0F];
  }
}

bool convert(std::string_view str, peer_id& x) {
  if (str.size() != peer_id::num_bytes * 2)
    return false;
  peer_id::array_type bytes;
  for (size_t index = 0; index < peer_id::num_bytes; ++index) {
    auto hi = hex_value(str[index * 2]);
    auto lo = hex_value(str[index * 2 + 1]);
    if (hi < 0 || lo < 0)
      return false;
    bytes[index] = static_cast<std::byte>((hi << 4) | lo);
  }
  x = peer_id{bytes};
  return true;
}

std::string to_string(const peer_id& x) {
  std::string result;
  convert(x, result);
  return result;
}

} // namespace gossamer
