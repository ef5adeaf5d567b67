#pragma once

#include "gossamer/detail/comparable.hh"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace gossamer {

/// Represents a host name or IP address plus a TCP port.
struct network_info : detail::comparable<network_info> {
  network_info() = default;

  network_info(std::string addr, uint16_t port);

  std::string address;

  uint16_t port = 0;

  int compare(const network_info& other) const noexcept;
};

/// @relates network_info
template <class Inspector>
bool inspect(Inspector& f, network_info& x) {
  return f.object(x).fields(f.field("address", x.address),
                            f.field("port", x.port));
}

/// Renders `x` as `host:port`, with brackets around IPv6 addresses.
/// @relates network_info
void convert(const network_info& x, std::string& str);

/// Parses `host:port` or `[ipv6]:port`.
/// @relates network_info
bool convert(std::string_view str, network_info& x);

/// @relates network_info
std::string to_string(const network_info& x);

} // namespace gossamer

namespace std {

template <>
struct hash<gossamer::network_info> {
  size_t operator()(const gossamer::network_info& x) const {
    hash<string> f;
    return f(x.address) ^ static_cast<size_t>(x.port);
  }
};

} // namespace std
