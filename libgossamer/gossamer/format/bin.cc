#include "gossamer/format/bin.hh"

#include <caf/detail/network_order.hpp>

namespace gossamer::format::bin::v1 {

uint16_t to_network_order_impl(uint16_t value) {
  return caf::detail::to_network_order(value);
}

uint32_t to_network_order_impl(uint32_t value) {
  return caf::detail::to_network_order(value);
}

uint64_t to_network_order_impl(uint64_t value) {
  return caf::detail::to_network_order(value);
}

namespace {

template <class T>
bool read_unsigned(const_byte_pointer& first, const_byte_pointer last,
                   T& result) {
  if (last - first < static_cast<ptrdiff_t>(sizeof(T)))
    return false;
  memcpy(&result, first, sizeof(T));
  first += sizeof(T);
  result = to_network_order(result);
  return true;
}

template <class Signed>
bool read_signed(const_byte_pointer& first, const_byte_pointer last,
                 Signed& result) {
  std::make_unsigned_t<Signed> tmp = 0;
  if (!read(first, last, tmp))
    return false;
  result = static_cast<Signed>(tmp);
  return true;
}

} // namespace

bool read(const_byte_pointer& first, const_byte_pointer last, uint8_t& result) {
  if (first == last)
    return false;
  result = static_cast<uint8_t>(*first++);
  return true;
}

bool read(const_byte_pointer& first, const_byte_pointer last,
          uint16_t& result) {
  return read_unsigned(first, last, result);
}

bool read(const_byte_pointer& first, const_byte_pointer last,
          uint32_t& result) {
  return read_unsigned(first, last, result);
}

bool read(const_byte_pointer& first, const_byte_pointer last,
          uint64_t& result) {
  return read_unsigned(first, last, result);
}

bool read(const_byte_pointer& first, const_byte_pointer last, int8_t& result) {
  return read_signed(first, last, result);
}

bool read(const_byte_pointer& first, const_byte_pointer last, int16_t& result) {
  return read_signed(first, last, result);
}

bool read(const_byte_pointer& first, const_byte_pointer last, int32_t& result) {
  return read_signed(first, last, result);
}

bool read(const_byte_pointer& first, const_byte_pointer last, int64_t& result) {
  return read_signed(first, last, result);
}

bool read_varbyte(const_byte_pointer& first, const_byte_pointer last,
                  size_t& result) {
  uint32_t x = 0;
  for (size_t n = 0; n < max_varbyte_size; ++n) {
    if (first == last)
      return false;
    auto low7 = static_cast<uint8_t>(*first++);
    // The fifth group only has room for the four most significant bits.
    if (n == max_varbyte_size - 1 && (low7 & 0xF0) != 0)
      return false;
    x |= static_cast<uint32_t>(low7 & 0x7F) << (7 * n);
    if ((low7 & 0x80) == 0) {
      result = x;
      return true;
    }
  }
  return false;
}

void append_varbyte(caf::byte_buffer& buf, size_t value) {
  auto x = static_cast<uint32_t>(value);
  while (x > 0x7f) {
    buf.push_back(static_cast<std::byte>((x & 0x7f) | 0x80));
    x >>= 7;
  }
  buf.push_back(static_cast<std::byte>(x));
}

} // namespace gossamer::format::bin::v1
