#include "gossamer/error.hh"

#include "gossamer/detail/assert.hh"

#include <iterator>

namespace gossamer {

namespace {

constexpr std::string_view ec_names[] = {
  "none",
  "unspecified",
  "dial_cancelled",
  "peer_unavailable",
  "unknown_peer",
  "connect_timeout",
  "message_too_large",
  "frame_too_large",
  "truncated_frame",
  "deserialization_failed",
  "serialization_failed",
  "socket_failure",
  "shutting_down",
  "stream_unavailable",
  "output_buffer_full",
  "logic_error",
};

static_assert(std::size(ec_names)
              == static_cast<size_t>(ec::logic_error) + 1);

} // namespace

std::string to_string(ec code) {
  return std::string{enum_str(code)};
}

std::string_view enum_str(ec code) {
  auto index = static_cast<uint8_t>(code);
  GOSSAMER_ASSERT(index < std::size(ec_names));
  return ec_names[index];
}

bool convert(std::string_view str, ec& code) noexcept {
  for (size_t index = 0; index < std::size(ec_names); ++index) {
    if (ec_names[index] == str) {
      code = static_cast<ec>(index);
      return true;
    }
  }
  return false;
}

bool from_string(std::string_view str, ec& code) noexcept {
  return convert(str, code);
}

bool from_integer(std::underlying_type_t<ec> value, ec& code) noexcept {
  if (value < std::size(ec_names)) {
    code = static_cast<ec>(value);
    return true;
  }
  return false;
}

void convert(const caf::error& err, std::string& str) {
  if (!err) {
    str = "none";
    return;
  }
  if (err.category() != caf::type_id_v<ec>) {
    str = caf::to_string(err);
    return;
  }
  str = enum_str(static_cast<ec>(err.code()));
  if (const auto& ctx = err.context(); ctx.match_elements<std::string>()) {
    str += ": ";
    str += ctx.get_as<std::string>(0);
  }
}

ec code_of(const caf::error& err) noexcept {
  if (!err)
    return ec::none;
  if (err.category() != caf::type_id_v<ec>)
    return ec::unspecified;
  return static_cast<ec>(err.code());
}

} // namespace gossamer
