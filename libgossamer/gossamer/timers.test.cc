#include "gossamer/timers.hh"

#include "gossamer/gossamer-test.test.hh"

#include <algorithm>
#include <optional>
#include <string>

using namespace gossamer;
using namespace std::literals;

namespace {

using string_timers = timers<std::string>;

struct fixture : loop_fixture {
  string_timers uut{mpx};

  std::optional<string_timers::batch> result;

  void wait() {
    result.reset();
    uut.wait_and_drain([this](string_timers::batch xs) { result = xs; });
  }

  std::vector<std::string> payloads() {
    std::vector<std::string> xs;
    if (result)
      for (auto& [t, x] : *result)
        xs.push_back(x);
    std::sort(xs.begin(), xs.end());
    return xs;
  }
};

} // namespace

FIXTURE_SCOPE(timers_tests, fixture)

TEST(an empty instance never drains) {
  wait();
  CHECK(uut.waiting());
  mpx.run_for(100ms);
  CHECK(!result);
  CHECK_EQ(mpx.num_scheduled(), 0u);
}

TEST(draining returns only due entries) {
  auto t0 = mpx.now();
  uut.insert(t0 + 20ms, "t1");
  uut.insert(t0 + 150ms, "t2");
  uut.insert(t0 + 160ms, "t3");
  CHECK_EQ(uut.size(), 3u);
  CHECK(uut.next_wake() == t0 + 20ms);
  wait();
  CHECK(run_until([this] { return result.has_value(); }));
  CHECK(mpx.now() < t0 + 150ms);
  CHECK_EQ(payloads(), std::vector<std::string>{"t1"});
  CHECK(uut.next_wake() == t0 + 150ms);
  MESSAGE("wait until t2 and t3 have passed before draining again");
  while (mpx.now() < t0 + 160ms)
    mpx.run_for(10ms);
  wait();
  CHECK(run_until([this] { return result.has_value(); }));
  CHECK_EQ(payloads(), (std::vector<std::string>{"t2", "t3"}));
  CHECK(uut.empty());
  CHECK(!uut.next_wake());
}

TEST(entries with the same deadline drain together) {
  auto t = mpx.now() + 10ms;
  uut.insert(t, "a");
  uut.insert(t, "b");
  uut.insert(t, "c");
  wait();
  CHECK(run_until([this] { return result.has_value(); }));
  CHECK_EQ(payloads(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(entries in the past drain immediately) {
  auto t0 = mpx.now();
  uut.insert(t0 - 1s, "old");
  uut.insert(t0 - 2s, "older");
  wait();
  CHECK(run_until([this] { return result.has_value(); }, 100ms));
  CHECK_EQ(payloads(), (std::vector<std::string>{"old", "older"}));
}

TEST(inserting an earlier deadline moves the wakeup) {
  auto t0 = mpx.now();
  uut.insert(t0 + 10s, "late");
  wait();
  CHECK_EQ(mpx.num_scheduled(), 1u);
  uut.insert(t0 + 10ms, "early");
  CHECK(uut.next_wake() == t0 + 10ms);
  CHECK_EQ(mpx.num_scheduled(), 1u);
  CHECK(run_until([this] { return result.has_value(); }, 1s));
  CHECK_EQ(payloads(), std::vector<std::string>{"early"});
  CHECK_EQ(uut.size(), 1u);
}

TEST(inserting a later deadline keeps the wakeup) {
  auto t0 = mpx.now();
  uut.insert(t0 + 10ms, "a");
  wait();
  uut.insert(t0 + 10s, "b");
  CHECK(uut.next_wake() == t0 + 10ms);
  CHECK_EQ(mpx.num_scheduled(), 1u);
}

TEST(inserting into an empty instance wakes a waiting handler) {
  wait();
  mpx.run_for(20ms);
  CHECK(!result);
  uut.insert(mpx.now() + 5ms, "x");
  CHECK(run_until([this] { return result.has_value(); }, 1s));
  CHECK_EQ(payloads(), std::vector<std::string>{"x"});
}

TEST(the handler runs only once per call) {
  auto t0 = mpx.now();
  uut.insert(t0 + 5ms, "a");
  uut.insert(t0 + 10ms, "b");
  size_t calls = 0;
  uut.wait_and_drain([&calls](string_timers::batch) { ++calls; });
  mpx.run_for(50ms);
  CHECK_EQ(calls, 1u);
  CHECK(!uut.waiting());
  CHECK_EQ(uut.size(), 1u);
}

TEST(cancel_wait drops the handler) {
  uut.insert(mpx.now() + 5ms, "a");
  wait();
  uut.cancel_wait();
  CHECK_EQ(mpx.num_scheduled(), 0u);
  mpx.run_for(30ms);
  CHECK(!result);
  CHECK_EQ(uut.size(), 1u);
}

TEST(drain_until removes entries without waiting) {
  auto t0 = mpx.now();
  uut.insert(t0 + 1s, "a");
  uut.insert(t0 + 2s, "b");
  uut.insert(t0 + 3s, "c");
  auto xs = uut.drain_until(t0 + 2s);
  CHECK_EQ(xs.size(), 2u);
  CHECK(uut.next_wake() == t0 + 3s);
}

TEST(destroying the timers cancels the wakeup) {
  {
    string_timers tmp{mpx};
    tmp.insert(mpx.now() + 10ms, "a");
    tmp.wait_and_drain([](string_timers::batch) {
      CAF_FAIL("handler called after destroying the timers");
    });
    CHECK_EQ(mpx.num_scheduled(), 1u);
  }
  CHECK_EQ(mpx.num_scheduled(), 0u);
}

FIXTURE_SCOPE_END()
