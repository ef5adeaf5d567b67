#pragma once

#ifdef SUITE
#  define CAF_SUITE SUITE
#endif

#include <caf/test/bdd_dsl.hpp>

#include "gossamer/byte_stream.hh"
#include "gossamer/error.hh"
#include "gossamer/multiplexer.hh"
#include "gossamer/peer_id.hh"
#include "gossamer/time.hh"
#include "gossamer/transport.hh"

#include <caf/byte_buffer.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// -- test setup macros --------------------------------------------------------

#define TEST CAF_TEST
#define FIXTURE_SCOPE CAF_TEST_FIXTURE_SCOPE
#define FIXTURE_SCOPE_END CAF_TEST_FIXTURE_SCOPE_END

// -- logging macros -----------------------------------------------------------

#define ERROR CAF_TEST_PRINT_ERROR
#define INFO CAF_TEST_PRINT_INFO
#define VERBOSE CAF_TEST_PRINT_VERBOSE

// -- macros for checking results ---------------------------------------------

#define REQUIRE_EQUAL CAF_REQUIRE_EQUAL
#define REQUIRE_NOT_EQUAL CAF_REQUIRE_NOT_EQUAL
#define REQUIRE_LESS CAF_REQUIRE_LESS
#define REQUIRE_GREATER CAF_REQUIRE_GREATER
#define CHECK_EQUAL CAF_CHECK_EQUAL
#define CHECK_NOT_EQUAL CAF_CHECK_NOT_EQUAL
#define CHECK_LESS CAF_CHECK_LESS
#define CHECK_LESS_EQUAL CAF_CHECK_LESS_OR_EQUAL
#define CHECK_GREATER CAF_CHECK_GREATER
#define CHECK_GREATER_EQUAL CAF_CHECK_GREATER_OR_EQUAL
#define CHECK_FAIL CAF_CHECK_FAIL

// -- utility functions --------------------------------------------------------

/// Converts a string literal to a byte buffer.
caf::byte_buffer to_bytes(std::string_view str);

/// Returns `n` bytes of filler data.
caf::byte_buffer make_payload(size_t n, std::byte fill = std::byte{0x2A});

/// Encodes `len` as a 4-byte big-endian length prefix.
caf::byte_buffer make_prefix(uint32_t len);

/// Returns the error code of `err` or `ec::unspecified` if `err` belongs to a
/// different category.
inline gossamer::ec code(const caf::error& err) {
  return gossamer::code_of(err);
}

// -- fixtures -----------------------------------------------------------------

/// A transport that never touches the network. Tests decide when and how each
/// connect attempt completes.
class fake_transport : public gossamer::transport {
public:
  struct attempt {
    gossamer::peer_id peer;
    std::string protocol;
    connect_callback callback;
    bool disposed = false;
  };

  explicit fake_transport(gossamer::multiplexer& mpx) : mpx_(&mpx) {
    // nop
  }

  gossamer::connect_handle async_connect(const gossamer::peer_id& peer,
                                         std::string_view protocol,
                                         connect_callback f) override;

  /// Returns the number of calls to `async_connect`.
  size_t num_attempts() const noexcept {
    return attempts.size();
  }

  /// Returns the number of attempts that neither completed nor got disposed.
  size_t num_open() const;

  /// Completes attempt `index` with a connection from the next loop iteration.
  void succeed(size_t index);

  /// Completes attempt `index` with `reason` from the next loop iteration.
  void fail(size_t index, caf::error reason);

  std::vector<attempt> attempts;

private:
  gossamer::multiplexer* mpx_;
};

/// A connection that hands out memory streams.
class fake_connection : public gossamer::connection {
public:
  fake_connection(gossamer::peer_id remote, std::string protocol)
    : remote_(remote), protocol_(std::move(protocol)) {
    // nop
  }

  const gossamer::peer_id& remote() const noexcept override {
    return remote_;
  }

  std::string_view protocol() const noexcept override {
    return protocol_;
  }

  caf::expected<gossamer::byte_stream_ptr> open_stream() override {
    return gossamer::byte_stream_ptr{new gossamer::memory_stream};
  }

  void close() override {
    closed = true;
  }

  bool closed = false;

private:
  gossamer::peer_id remote_;
  std::string protocol_;
};

/// Provides a multiplexer plus some utility for running it in tests.
struct loop_fixture {
  gossamer::multiplexer mpx;

  /// Runs the loop until no more actions or events are immediately pending.
  void run_pending();

  /// Runs the loop until `pred` holds or `timeout` passed.
  bool run_until(std::function<bool()> pred,
                 gossamer::timespan timeout = std::chrono::seconds{5});
};
