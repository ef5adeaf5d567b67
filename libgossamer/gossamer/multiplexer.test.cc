#include "gossamer/multiplexer.hh"

#include "gossamer/gossamer-test.test.hh"

#include <caf/net/socket.hpp>
#include <caf/net/stream_socket.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace gossamer;
using namespace std::literals;

namespace {

struct recording_handler : socket_handler {
  std::vector<std::string> log;

  void handle_read_event() override {
    log.emplace_back("read");
  }

  void handle_write_event() override {
    log.emplace_back("write");
  }

  void handle_error(const caf::error&) override {
    log.emplace_back("error");
  }
};

/// Closes its socket on the first read event and registers a fresh socket for
/// writing. The fresh socket usually reuses the fd number of the closed one.
struct replacing_handler : socket_handler {
  multiplexer* mpx = nullptr;
  caf::net::stream_socket fd;
  caf::net::stream_socket fresh;
  caf::net::stream_socket fresh_peer;
  recording_handler successor;

  void handle_read_event() override {
    mpx->deregister(fd.id);
    caf::net::close(fd);
    auto fds = caf::net::make_stream_socket_pair();
    if (!fds)
      CAF_FAIL("failed to create a socket pair: " << fds.error());
    fresh = fds->first;
    fresh_peer = fds->second;
    mpx->register_writing(fresh.id, &successor);
  }

  void handle_write_event() override {
    // nop
  }

  void handle_error(const caf::error&) override {
    // nop
  }
};

struct fixture : loop_fixture {
  std::vector<std::string> log;
};

} // namespace

FIXTURE_SCOPE(multiplexer_tests, fixture)

TEST(posted actions run in the next cycle in posting order) {
  mpx.post([this] { log.emplace_back("a"); });
  mpx.post([this] {
    log.emplace_back("b");
    mpx.post([this] { log.emplace_back("d"); });
  });
  mpx.post([this] { log.emplace_back("c"); });
  CHECK_EQ(mpx.num_posted(), 3u);
  CHECK(log.empty());
  CHECK(mpx.run_once(0s));
  CHECK_EQ(log, (std::vector<std::string>{"a", "b", "c"}));
  CHECK(mpx.run_once(0s));
  CHECK_EQ(log, (std::vector<std::string>{"a", "b", "c", "d"}));
  CHECK(!mpx.run_once(0s));
}

TEST(scheduled actions run in deadline order) {
  auto t0 = mpx.now();
  mpx.schedule(t0 + 20ms, [this] { log.emplace_back("second"); });
  mpx.schedule(t0 + 10ms, [this] { log.emplace_back("first"); });
  mpx.schedule(t0 + 30ms, [this] { log.emplace_back("third"); });
  CHECK(mpx.next_deadline() == t0 + 10ms);
  CHECK(run_until([this] { return log.size() == 3; }, 1s));
  CHECK_EQ(log, (std::vector<std::string>{"first", "second", "third"}));
  CHECK(mpx.now() >= t0 + 30ms);
  CHECK_EQ(mpx.num_scheduled(), 0u);
}

TEST(cancelled actions never run) {
  auto id1 = mpx.post([this] { log.emplace_back("posted"); });
  auto id2 = mpx.schedule_after(5ms, [this] { log.emplace_back("timed"); });
  CHECK(mpx.cancel(id1));
  CHECK(mpx.cancel(id2));
  CHECK(!mpx.cancel(id1));
  CHECK(!mpx.cancel(multiplexer::invalid_action_id));
  mpx.run_for(30ms);
  CHECK(log.empty());
}

TEST(an action may cancel another action of the same cycle) {
  auto second = multiplexer::invalid_action_id;
  mpx.post([this, &second] { mpx.cancel(second); });
  second = mpx.post([this] { log.emplace_back("second"); });
  run_pending();
  CHECK(log.empty());
}

TEST(run_until stops at the timeout) {
  auto t0 = mpx.now();
  CHECK(!run_until([] { return false; }, 50ms));
  CHECK(mpx.now() >= t0 + 50ms);
}

TEST(shutdown wakes up a blocked loop from another thread) {
  std::thread t{[this] {
    std::this_thread::sleep_for(20ms);
    mpx.shutdown();
  }};
  mpx.run();
  t.join();
  CHECK(mpx.shutting_down());
}

TEST(the multiplexer dispatches socket events to handlers) {
  auto fds = caf::net::make_stream_socket_pair();
  REQUIRE(fds);
  auto [fd1, fd2] = *fds;
  recording_handler handler;
  mpx.register_reading(fd1.id, &handler);
  CHECK(mpx.is_registered(fd1.id));
  CHECK_EQ(mpx.num_sockets(), 1u);
  mpx.run_once(10ms);
  CHECK(handler.log.empty());
  std::byte token{1};
  REQUIRE_EQUAL(caf::net::write(fd2, caf::const_byte_span{&token, 1}), 1);
  mpx.run_once(1s);
  CHECK_EQ(handler.log, std::vector<std::string>{"read"});
  MESSAGE("a connected socket is writable right away");
  mpx.unregister_reading(fd1.id);
  CHECK(!mpx.is_registered(fd1.id));
  mpx.register_writing(fd1.id, &handler);
  mpx.run_once(1s);
  CHECK_EQ(handler.log, (std::vector<std::string>{"read", "write"}));
  mpx.deregister(fd1.id);
  CHECK_EQ(mpx.num_sockets(), 0u);
  caf::net::close(fd1);
  caf::net::close(fd2);
}

TEST(handlers registered during dispatch wait for the next poll) {
  auto fds = caf::net::make_stream_socket_pair();
  REQUIRE(fds);
  auto [fd1, fd2] = *fds;
  replacing_handler handler;
  handler.mpx = &mpx;
  handler.fd = fd1;
  mpx.register_reading(fd1.id, &handler);
  MESSAGE("closing the peer makes fd1 readable and reports a hangup");
  caf::net::close(fd2);
  mpx.run_once(1s);
  REQUIRE(mpx.is_registered(handler.fresh.id));
  CHECK(handler.successor.log.empty());
  MESSAGE("the fresh socket receives its own events with the next poll");
  mpx.run_once(1s);
  CHECK_EQ(handler.successor.log, std::vector<std::string>{"write"});
  mpx.deregister(handler.fresh.id);
  caf::net::close(handler.fresh);
  caf::net::close(handler.fresh_peer);
}

TEST(replacing the handler of an fd hides stale events from the new handler) {
  auto fds = caf::net::make_stream_socket_pair();
  REQUIRE(fds);
  auto [fd1, fd2] = *fds;
  recording_handler second;
  struct swapping_handler : recording_handler {
    multiplexer* mpx = nullptr;
    caf::net::socket_id fd = caf::net::invalid_socket_id;
    socket_handler* next = nullptr;
    void handle_read_event() override {
      recording_handler::handle_read_event();
      mpx->register_writing(fd, next);
    }
  } first;
  first.mpx = &mpx;
  first.fd = fd1.id;
  first.next = &second;
  mpx.register_reading(fd1.id, &first);
  std::byte token{1};
  REQUIRE_EQUAL(caf::net::write(fd2, caf::const_byte_span{&token, 1}), 1);
  mpx.run_once(1s);
  CHECK_EQ(first.log, std::vector<std::string>{"read"});
  CHECK(second.log.empty());
  mpx.deregister(fd1.id);
  caf::net::close(fd1);
  caf::net::close(fd2);
}

FIXTURE_SCOPE_END()
