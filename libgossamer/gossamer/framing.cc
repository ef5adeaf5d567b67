#include "gossamer/framing.hh"

#include <algorithm>
#include <format>
#include <string>

namespace gossamer {

namespace {

constexpr std::string_view frame_state_names[] = {
  "awaiting_prefix", "accumulating_payload", "have_message",
  "clean_eof",       "error",
};

caf::error truncated(caf::const_byte_span buf) {
  log::framing::error("truncated-frame",
                      "stream ended with {} bytes of an incomplete frame",
                      buf.size());
  auto what = buf.size() < frame_prefix_size
                ? std::string{"stream ended inside a length prefix"}
                : std::format("stream ended after {} of {} payload bytes",
                              buf.size() - frame_prefix_size,
                              *peek_frame_size(buf));
  return make_error(ec::truncated_frame, std::move(what));
}

} // namespace

std::string_view enum_str(frame_state x) noexcept {
  return frame_state_names[static_cast<uint8_t>(x)];
}

namespace detail {

void write_frame_prefix(std::byte* first, uint32_t len) noexcept {
  format::bin::v1::write_unsigned(len, first);
}

} // namespace detail

std::optional<uint32_t> peek_frame_size(caf::const_byte_span buf) noexcept {
  auto first = buf.data();
  auto len = uint32_t{0};
  if (!format::bin::v1::read(first, first + buf.size(), len))
    return std::nullopt;
  return len;
}

namespace {

// Parses the frame at the front of `buf` without consuming it. Sets
// `consumed` to the size of the frame including its prefix on success.
caf::expected<std::optional<caf::byte_buffer>>
parse_frame(caf::const_byte_span buf, size_t& consumed) {
  consumed = 0;
  auto len = peek_frame_size(buf);
  if (!len)
    return std::optional<caf::byte_buffer>{};
  if (*len >= max_message_size) {
    log::framing::error("frame-too-large",
                        "peer announced a frame of {} bytes (limit: {})", *len,
                        max_message_size);
    return make_error(ec::frame_too_large,
                      std::format("announced frame size {} exceeds the limit "
                                  "of {}",
                                  *len, max_message_size - 1));
  }
  auto frame_size = frame_prefix_size + *len;
  if (buf.size() < frame_size)
    return std::optional<caf::byte_buffer>{};
  auto first = buf.begin() + frame_prefix_size;
  auto last = buf.begin() + static_cast<ptrdiff_t>(frame_size);
  consumed = frame_size;
  return std::optional<caf::byte_buffer>{caf::byte_buffer{first, last}};
}

} // namespace

caf::expected<std::optional<caf::byte_buffer>>
try_split_frame(caf::byte_buffer& buf) {
  auto consumed = size_t{0};
  auto frame = parse_frame(buf, consumed);
  if (consumed > 0)
    buf.erase(buf.begin(), buf.begin() + static_cast<ptrdiff_t>(consumed));
  return frame;
}

caf::error write_lp(byte_stream& out, caf::const_byte_span payload) {
  if (payload.size() >= max_message_size) {
    log::framing::warning("message-too-large",
                          "refused to send a message of {} bytes (limit: {})",
                          payload.size(), max_message_size);
    return make_error(ec::message_too_large,
                      std::format("payload size {} exceeds the limit of {}",
                                  payload.size(), max_message_size - 1));
  }
  caf::byte_buffer frame;
  frame.resize(frame_prefix_size);
  detail::write_frame_prefix(frame.data(),
                             static_cast<uint32_t>(payload.size()));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return out.write(frame);
}

caf::expected<std::optional<caf::byte_buffer>>
read_lp(byte_stream& in, caf::byte_buffer& buf, size_t chunk_size) {
  for (;;) {
    auto frame = try_split_frame(buf);
    if (!frame || *frame)
      return frame;
    auto offset = buf.size();
    buf.resize(offset + chunk_size);
    auto res = in.read(caf::byte_span{buf.data() + offset, chunk_size});
    buf.resize(offset + static_cast<size_t>(std::max(res, ptrdiff_t{0})));
    if (res == 0) {
      if (buf.empty())
        return std::optional<caf::byte_buffer>{};
      return truncated(buf);
    }
    if (res < 0) {
      log::framing::error("read-failed", "failed to read from the stream");
      return make_error(ec::socket_failure, "failed to read from the stream");
    }
  }
}

void frame_reader::append(caf::const_byte_span bytes) {
  // Drop consumed bytes once they make up at least half of the buffer. This
  // keeps appending and splitting linear in the number of received bytes.
  if (pos_ > 0 && pos_ * 2 >= buf_.size()) {
    buf_.erase(buf_.begin(), buf_.begin() + static_cast<ptrdiff_t>(pos_));
    pos_ = 0;
  }
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

caf::expected<std::optional<caf::byte_buffer>> frame_reader::next() {
  switch (state_) {
    case frame_state::error:
      return err_;
    case frame_state::clean_eof:
      return std::optional<caf::byte_buffer>{};
    default:
      break;
  }
  auto unread = caf::const_byte_span{buf_}.subspan(pos_);
  auto consumed = size_t{0};
  auto frame = parse_frame(unread, consumed);
  if (!frame) {
    state_ = frame_state::error;
    err_ = frame.error();
    return frame;
  }
  if (*frame) {
    pos_ += consumed;
    if (pos_ == buf_.size()) {
      buf_.clear();
      pos_ = 0;
    }
    state_ = frame_state::have_message;
    return frame;
  }
  if (eof_) {
    if (unread.empty()) {
      state_ = frame_state::clean_eof;
      return std::optional<caf::byte_buffer>{};
    }
    state_ = frame_state::error;
    err_ = truncated(unread);
    return err_;
  }
  state_ = unread.size() < frame_prefix_size
             ? frame_state::awaiting_prefix
             : frame_state::accumulating_payload;
  return std::optional<caf::byte_buffer>{};
}

} // namespace gossamer
