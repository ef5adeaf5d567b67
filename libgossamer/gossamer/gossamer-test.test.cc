#define CAF_TEST_NO_MAIN

#include "gossamer/gossamer-test.test.hh"

#include <caf/test/unit_test_impl.hpp>

#include "gossamer/configuration.hh"
#include "gossamer/framing.hh"

#include <algorithm>
#include <memory>
#include <utility>

using namespace gossamer;

// -- utility functions --------------------------------------------------------

caf::byte_buffer to_bytes(std::string_view str) {
  caf::byte_buffer result;
  result.reserve(str.size());
  for (auto ch : str)
    result.push_back(static_cast<std::byte>(ch));
  return result;
}

caf::byte_buffer make_payload(size_t n, std::byte fill) {
  return caf::byte_buffer(n, fill);
}

caf::byte_buffer make_prefix(uint32_t len) {
  caf::byte_buffer result(frame_prefix_size);
  detail::write_frame_prefix(result.data(), len);
  return result;
}

// -- fake_transport -----------------------------------------------------------

connect_handle fake_transport::async_connect(const peer_id& peer,
                                             std::string_view protocol,
                                             connect_callback f) {
  auto index = attempts.size();
  attempts.push_back(attempt{peer, std::string{protocol}, std::move(f)});
  return connect_handle{[this, index] {
    auto& entry = attempts[index];
    entry.disposed = true;
    entry.callback = nullptr;
  }};
}

size_t fake_transport::num_open() const {
  return static_cast<size_t>(
    std::count_if(attempts.begin(), attempts.end(),
                  [](const attempt& x) { return x.callback != nullptr; }));
}

void fake_transport::succeed(size_t index) {
  mpx_->post([this, index] {
    auto& entry = attempts[index];
    if (!entry.callback)
      return;
    auto f = std::move(entry.callback);
    entry.callback = nullptr;
    f(connection_ptr{
      std::make_shared<fake_connection>(entry.peer, entry.protocol)});
  });
}

void fake_transport::fail(size_t index, caf::error reason) {
  mpx_->post([this, index, reason{std::move(reason)}]() mutable {
    auto& entry = attempts[index];
    if (!entry.callback)
      return;
    auto f = std::move(entry.callback);
    entry.callback = nullptr;
    f(std::move(reason));
  });
}

// -- loop_fixture -------------------------------------------------------------

void loop_fixture::run_pending() {
  while (mpx.run_once(timespan{0})) {
    // repeat
  }
}

bool loop_fixture::run_until(std::function<bool()> pred, timespan timeout) {
  return mpx.run_until(std::move(pred), timeout);
}

// -- main ---------------------------------------------------------------------

int main(int argc, char** argv) {
  configuration::init_global_state();
  return caf::test::main(argc, argv);
}
