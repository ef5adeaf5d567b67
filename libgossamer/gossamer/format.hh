#pragma once

#include "gossamer/error.hh"
#include "gossamer/message.hh"
#include "gossamer/network_info.hh"
#include "gossamer/peer_id.hh"
#include "gossamer/time.hh"

#include <format>
#include <string>

namespace gossamer::detail {

template <class T>
struct default_formatter {
  using string_formatter = std::formatter<std::string, char>;

  constexpr auto parse(std::format_parse_context& ctx) {
    return string_formatter{}.parse(ctx);
  }

  template <typename FormatContext>
  auto format(const T& value, FormatContext& ctx) const {
    std::string out;
    gossamer::convert(value, out);
    return string_formatter{}.format(out, ctx);
  }
};

} // namespace gossamer::detail

#define GOSSAMER_STD_FORMATTER_IMPL(type_name)                                 \
  template <>                                                                  \
  struct formatter<type_name, char>                                            \
    : gossamer::detail::default_formatter<type_name> {}

namespace std {

GOSSAMER_STD_FORMATTER_IMPL(gossamer::ec);
GOSSAMER_STD_FORMATTER_IMPL(gossamer::message);
GOSSAMER_STD_FORMATTER_IMPL(gossamer::network_info);
GOSSAMER_STD_FORMATTER_IMPL(gossamer::peer_id);
GOSSAMER_STD_FORMATTER_IMPL(caf::error);

template <class T>
struct formatter<caf::expected<T>, char> {
  using string_formatter = std::formatter<std::string, char>;

  constexpr auto parse(std::format_parse_context& ctx) {
    return string_formatter{}.parse(ctx);
  }

  template <typename FormatContext>
  auto format(const caf::expected<T>& value, FormatContext& ctx) const {
    std::string out;
    if (value)
      out = "ok";
    else
      gossamer::convert(value.error(), out);
    return string_formatter{}.format(out, ctx);
  }
};

} // namespace std

#undef GOSSAMER_STD_FORMATTER_IMPL
