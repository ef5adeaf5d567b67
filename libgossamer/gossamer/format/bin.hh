#pragma once

#include "gossamer/detail/type_traits.hh"

#include <caf/byte_buffer.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Compact binary format for protocol messages.
///
/// - Integers use network byte order. Signed integers are written as their
///   unsigned two's complement representation.
/// - `bool` is a single byte, either 0 or 1.
/// - Strings, byte vectors and lists start with their size as varbyte.
/// - Fixed-size arrays have no size prefix.
/// - Optionals start with a 0/1 flag byte.
/// - Variants start with the 8-bit index of the active alternative.
///
/// Structs and enums go through their `inspect` overload. Struct fields are
/// written in order without any names or padding.
namespace gossamer::format::bin::v1 {

// -- byte order ---------------------------------------------------------------

uint16_t to_network_order_impl(uint16_t value);

uint32_t to_network_order_impl(uint32_t value);

uint64_t to_network_order_impl(uint64_t value);

/// Converts `value` from native to network byte order and vice versa.
template <class T>
T to_network_order(T value) {
  static_assert(std::is_unsigned_v<T>);
  if constexpr (sizeof(T) == 1) {
    return value;
  } else if constexpr (sizeof(T) == 2) {
    return static_cast<T>(to_network_order_impl(static_cast<uint16_t>(value)));
  } else if constexpr (sizeof(T) == 4) {
    return static_cast<T>(to_network_order_impl(static_cast<uint32_t>(value)));
  } else {
    static_assert(sizeof(T) == 8);
    return static_cast<T>(to_network_order_impl(static_cast<uint64_t>(value)));
  }
}

// -- reading primitives -------------------------------------------------------

using const_byte_pointer = const std::byte*;

/// Varbyte sizes may use up to five groups of seven bits, i.e., the format
/// limits sizes to 32 bits.
constexpr size_t max_varbyte_size = 5;

bool read(const_byte_pointer& first, const_byte_pointer last, uint8_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, uint16_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, uint32_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, uint64_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, int8_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, int16_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, int32_t& result);

bool read(const_byte_pointer& first, const_byte_pointer last, int64_t& result);

/// Reads a varbyte-encoded size.
bool read_varbyte(const_byte_pointer& first, const_byte_pointer last,
                  size_t& result);

// -- writing primitives -------------------------------------------------------

/// Writes `value` in network byte order to `out`.
template <class T>
std::byte* write_unsigned(T value, std::byte* out) noexcept {
  static_assert(std::is_unsigned_v<T> && !std::is_same_v<T, bool>);
  auto tmp = to_network_order(value);
  memcpy(out, &tmp, sizeof(T));
  return out + sizeof(T);
}

/// Appends `value` in network byte order to `buf`.
template <class T>
void append_unsigned(caf::byte_buffer& buf, T value) {
  auto offset = buf.size();
  buf.resize(offset + sizeof(T));
  write_unsigned(value, buf.data() + offset);
}

/// Returns the number of bytes for encoding `value` as varbyte.
constexpr size_t varbyte_size(size_t value) noexcept {
  size_t result = 1;
  while (value > 0x7f) {
    value >>= 7;
    ++result;
  }
  return result;
}

/// Appends `value` as varbyte to `buf`.
/// @pre `value` fits into 32 bits.
void append_varbyte(caf::byte_buffer& buf, size_t value);

// -- encoder ------------------------------------------------------------------

/// Serializes values into a byte buffer. Implements the subset of the
/// `inspect` API used by the protocol messages.
class encoder {
public:
  static constexpr bool is_loading = false;

  explicit encoder(caf::byte_buffer& buf) : buf_(&buf) {
    // nop
  }

  constexpr bool has_human_readable_format() const noexcept {
    return false;
  }

  template <class T>
  encoder& object(const T&) {
    return *this;
  }

  encoder& pretty_name(std::string_view) {
    return *this;
  }

  template <class T>
  bool apply(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      buf_->push_back(static_cast<std::byte>(value ? 1 : 0));
      return true;
    } else if constexpr (std::is_same_v<T, std::byte>) {
      buf_->push_back(value);
      return true;
    } else if constexpr (std::is_integral_v<T>) {
      append_unsigned(*buf_, static_cast<std::make_unsigned_t<T>>(value));
      return true;
    } else if constexpr (std::is_same_v<T, std::string>
                         || std::is_same_v<T, std::vector<std::byte>>) {
      return size_prefix(value.size()) && append_raw(value.data(), value.size());
    } else if constexpr (detail::is_variant<T>) {
      static_assert(std::variant_size_v<T> < 256);
      buf_->push_back(static_cast<std::byte>(value.index()));
      return std::visit([this](const auto& x) { return apply(x); }, value);
    } else if constexpr (detail::is_optional<T>) {
      if (!value)
        return apply(false);
      return apply(true) && apply(*value);
    } else if constexpr (detail::is_array<T>) {
      for (const auto& item : value)
        if (!apply(item))
          return false;
      return true;
    } else if constexpr (detail::is_list<T>) {
      if (!size_prefix(value.size()))
        return false;
      for (const auto& item : value)
        if (!apply(item))
          return false;
      return true;
    } else {
      // Serializing never modifies the value.
      return inspect(*this, const_cast<T&>(value));
    }
  }

  template <class Getter, class Setter>
  bool apply(Getter&& get, Setter&&) {
    return apply(get());
  }

  template <class T>
  const T& field(std::string_view, const T& value) {
    return value;
  }

  template <class... Ts>
  bool fields(const Ts&... values) {
    return (apply(values) && ...);
  }

private:
  bool size_prefix(size_t size) {
    if (size > UINT32_MAX)
      return false;
    append_varbyte(*buf_, size);
    return true;
  }

  bool append_raw(const void* data, size_t size) {
    auto first = static_cast<const std::byte*>(data);
    buf_->insert(buf_->end(), first, first + size);
    return true;
  }

  caf::byte_buffer* buf_;
};

// -- decoder ------------------------------------------------------------------

/// Deserializes values from a byte range. Rejects values the encoder never
/// produces, e.g., a bool other than 0 or 1.
class decoder {
public:
  static constexpr bool is_loading = true;

  decoder(const_byte_pointer first, const_byte_pointer last)
    : pos_(first), end_(last) {
    // nop
  }

  constexpr bool has_human_readable_format() const noexcept {
    return false;
  }

  template <class T>
  decoder& object(const T&) {
    return *this;
  }

  decoder& pretty_name(std::string_view) {
    return *this;
  }

  template <class T>
  bool apply(T& value) {
    if constexpr (std::is_same_v<T, bool>) {
      auto tmp = uint8_t{0};
      if (!read(pos_, end_, tmp) || tmp > 1)
        return false;
      value = tmp == 1;
      return true;
    } else if constexpr (std::is_same_v<T, std::byte>) {
      if (pos_ == end_)
        return false;
      value = *pos_++;
      return true;
    } else if constexpr (std::is_integral_v<T>) {
      return read(pos_, end_, value);
    } else if constexpr (std::is_same_v<T, std::string>) {
      auto size = size_t{0};
      if (!read_size(size))
        return false;
      value.assign(reinterpret_cast<const char*>(pos_), size);
      pos_ += size;
      return true;
    } else if constexpr (std::is_same_v<T, std::vector<std::byte>>) {
      auto size = size_t{0};
      if (!read_size(size))
        return false;
      value.assign(pos_, pos_ + size);
      pos_ += size;
      return true;
    } else if constexpr (detail::is_variant<T>) {
      auto index = uint8_t{0};
      if (!read(pos_, end_, index))
        return false;
      return load_alternative<0>(value, index);
    } else if constexpr (detail::is_optional<T>) {
      auto engaged = false;
      if (!apply(engaged))
        return false;
      if (!engaged) {
        value.reset();
        return true;
      }
      return apply(value.emplace());
    } else if constexpr (detail::is_array<T>) {
      for (auto& item : value)
        if (!apply(item))
          return false;
      return true;
    } else if constexpr (detail::is_list<T>) {
      auto size = size_t{0};
      // Each element occupies at least one byte.
      if (!read_size(size))
        return false;
      value.clear();
      value.reserve(size);
      for (size_t i = 0; i < size; ++i)
        if (!apply(value.emplace_back()))
          return false;
      return true;
    } else {
      return inspect(*this, value);
    }
  }

  template <class Getter, class Setter>
  bool apply(Getter&& get, Setter&& set) {
    auto tmp = std::decay_t<decltype(get())>{};
    if (!apply(tmp))
      return false;
    if constexpr (std::is_same_v<decltype(set(std::move(tmp))), bool>) {
      return set(std::move(tmp));
    } else {
      set(std::move(tmp));
      return true;
    }
  }

  template <class T>
  T& field(std::string_view, T& value) {
    return value;
  }

  template <class... Ts>
  bool fields(Ts&... values) {
    return (apply(values) && ...);
  }

  size_t remaining() const noexcept {
    return static_cast<size_t>(end_ - pos_);
  }

private:
  /// Reads a size prefix and checks it against the remaining input.
  bool read_size(size_t& size) {
    return read_varbyte(pos_, end_, size) && size <= remaining();
  }

  template <size_t Index, class... Ts>
  bool load_alternative(std::variant<Ts...>& value, size_t index) {
    if constexpr (Index == sizeof...(Ts)) {
      return false;
    } else {
      if (index != Index)
        return load_alternative<Index + 1>(value, index);
      return apply(value.template emplace<Index>());
    }
  }

  const_byte_pointer pos_;
  const_byte_pointer end_;
};

// -- convenience functions ----------------------------------------------------

/// Appends the binary representation of `value` to `buf`.
template <class T>
bool encode_to(caf::byte_buffer& buf, const T& value) {
  encoder f{buf};
  return f.apply(value);
}

/// Decodes `value` from `[first, last)`. Fails unless decoding consumes the
/// entire input.
template <class T>
bool decode_from(const_byte_pointer first, const_byte_pointer last, T& value) {
  decoder f{first, last};
  return f.apply(value) && f.remaining() == 0;
}

} // namespace gossamer::format::bin::v1
