#pragma once

#include "gossamer/detail/comparable.hh"

#include <array>
#include <cstddef>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>

namespace gossamer {

/// Opaque identifier of a remote participant. The 32 bytes match the size of
/// an ed25519 public key, which is what peers use to identify themselves.
class peer_id : detail::comparable<peer_id> {
public:
  // -- constants --------------------------------------------------------------

  static constexpr size_t num_bytes = 32;

  /// Number of hex digits in the short form used for log output.
  static constexpr size_t short_string_size = 10;

  // -- member types -----------------------------------------------------------

  using array_type = std::array<std::byte, num_bytes>;

  peer_id() noexcept;

  explicit peer_id(const array_type& bytes) noexcept : bytes_(bytes) {
    // nop
  }

  peer_id(const peer_id&) noexcept = default;

  peer_id& operator=(const peer_id&) noexcept = default;

  // -- properties -------------------------------------------------------------

  /// Returns the individual bytes for the ID.
  const array_type& bytes() const noexcept {
    return bytes_;
  }

  /// Queries whether this ID is *not* default-constructed.
  bool valid() const noexcept;

  /// Queries whether this ID is *not* default-constructed.
  explicit operator bool() const noexcept {
    return valid();
  }

  /// Queries whether this ID is default-constructed.
  bool operator!() const noexcept {
    return !valid();
  }

  /// Compares this instance to `other`.
  /// @returns a negative value if `*this < other`, 0 if `*this == other`, and
  ///          a positive value otherwise.
  int compare(const peer_id& other) const noexcept {
    return memcmp(bytes_.data(), other.bytes_.data(), num_bytes);
  }

  /// Returns a hash value for the ID.
  size_t hash() const noexcept;

  /// Returns the first `short_string_size` hex digits of the ID.
  std::string short_string() const;

  /// Creates a random peer_id.
  static peer_id random();

  /// Creates a random peer_id with a predefined seed.
  static peer_id random(unsigned seed);

  /// Convenience function for creating a peer_id with all bits set to zero.
  static peer_id nil() noexcept {
    return peer_id{};
  }

  /// Queries whether `str` is convertible to a `peer_id`.
  static bool can_parse(std::string_view str);

  // -- inspection -------------------------------------------------------------

  template <class Inspector>
  friend bool inspect(Inspector& f, peer_id& x) {
    return f.apply(x.bytes_);
  }

private:
  array_type bytes_;
};

// -- free functions -----------------------------------------------------------

/// Renders `x` as 64 lowercase hex digits.
/// @relates peer_id
void convert(const peer_id& x, std::string& str);

/// @relates peer_id
bool convert(std::string_view str, peer_id& x);

/// @relates peer_id
std::string to_string(const peer_id& x);

} // namespace gossamer

namespace std {

template <>
struct hash<gossamer::peer_id> {
  size_t operator()(const gossamer::peer_id& x) const noexcept {
    return x.hash();
  }
};

} // namespace std
