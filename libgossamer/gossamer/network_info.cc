#include "gossamer/network_info.hh"

#include <charconv>
#include <utility>

namespace gossamer {

network_info::network_info(std::string addr, uint16_t port)
  : address(std::move(addr)), port(port) {
  // nop
}

int network_info::compare(const network_info& other) const noexcept {
  auto res = address.compare(other.address);
  if (res == 0)
    return static_cast<int>(port) - static_cast<int>(other.port);
  return res;
}

void convert(const network_info& x, std::string& str) {
  if (x.address.find(':') != std::string::npos) {
    str = '[';
    str += x.address;
    str += ']';
  } else {
    str = x.address;
  }
  str += ':';
  str += std::to_string(x.port);
}

bool convert(std::string_view str, network_info& x) {
  auto sep = str.rfind(':');
  if (sep == std::string_view::npos || sep == 0 || sep + 1 == str.size())
    return false;
  auto host = str.substr(0, sep);
  if (host.front() == '[') {
    if (host.size() < 3 || host.back() != ']')
      return false;
    host = host.substr(1, host.size() - 2);
  } else if (host.find(':') != std::string_view::npos) {
    // Unbracketed IPv6 addresses are ambiguous.
    return false;
  }
  auto port_str = str.substr(sep + 1);
  uint16_t port = 0;
  auto [ptr, err] = std::from_chars(port_str.data(),
                                    port_str.data() + port_str.size(), port);
  if (err != std::errc{} || ptr != port_str.data() + port_str.size())
    return false;
  x.address.assign(host.data(), host.size());
  x.port = port;
  return true;
}

std::string to_string(const network_info& x) {
  std::string result;
  convert(x, result);
  return result;
}

} // namespace gossamer
