#pragma once

#include "gossamer/time.hh"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

// This header contains hard-coded default values for various gossamer options.

namespace gossamer::defaults {

/// Configures how long a TCP connect attempt may take before it fails with
/// `ec::connect_timeout`.
constexpr timespan connect_timeout = std::chrono::seconds{10};

/// Configures how many bytes a stream read requests at once.
constexpr size_t read_chunk_size = 4096;

/// Configures how many chunks a channel reads per read event before it yields
/// to other sockets.
constexpr size_t max_reads_per_event = 16;

/// Configures how many bytes a channel buffers for a peer that does not read
/// fast enough. `send` fails with `ec::output_buffer_full` beyond this limit.
constexpr size_t max_pending_output = 1024 * 1024;

/// Disables console output unless configured otherwise.
constexpr std::string_view console_verbosity = "quiet";

} // namespace gossamer::defaults

namespace gossamer::defaults::framing {

/// Size of the big-endian length prefix in front of each frame.
constexpr size_t prefix_size = 4;

/// Upper bound (exclusive) for the payload of a single frame. Both ends of a
/// connection use the same value.
constexpr size_t max_message_size = 4096;

} // namespace gossamer::defaults::framing
