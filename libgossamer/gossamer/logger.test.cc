#include "gossamer/logger.hh"

#include "gossamer/gossamer-test.test.hh"

#include "gossamer/dialer.hh"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gossamer;
using namespace std::literals;

namespace {

class recorder : public event_observer {
public:
  recorder(event::severity_level severity, event::component_mask mask)
    : severity_(severity), mask_(mask) {
    // nop
  }

  void observe(event_ptr what) override {
    std::lock_guard<std::mutex> guard{mtx_};
    events.push_back(std::move(what));
  }

  bool accepts(event::severity_level severity,
               event::component_type component) const override {
    return severity <= severity_ && has_component(mask_, component);
  }

  std::vector<std::string> identifiers() {
    std::lock_guard<std::mutex> guard{mtx_};
    std::vector<std::string> result;
    for (auto& ev : events)
      result.emplace_back(ev->identifier);
    return result;
  }

  std::vector<event_ptr> events;

private:
  event::severity_level severity_;
  event::component_mask mask_;
  std::mutex mtx_;
};

struct fixture : loop_fixture {
  scoped_logger no_logger{nullptr};

  std::shared_ptr<recorder> rec;

  void install(event::severity_level severity,
               event::component_mask mask = event::default_component_mask) {
    rec = std::make_shared<recorder>(severity, mask);
    logger(rec);
  }
};

} // namespace

FIXTURE_SCOPE(logger_tests, fixture)

TEST(log functions forward events to the global observer) {
  install(event::severity_level::debug);
  log::app::info("hello", "hello {}", "world");
  REQUIRE_EQUAL(rec->events.size(), 1u);
  auto& ev = *rec->events[0];
  CHECK(ev.identifier == "hello");
  CHECK_EQ(ev.description, "hello world");
  CHECK(ev.severity == event::severity_level::info);
  CHECK(ev.component == event::component_type::app);
}

TEST(observers filter by severity) {
  install(event::severity_level::warning);
  log::app::debug("a", "not logged");
  log::app::info("b", "not logged");
  log::app::warning("c", "logged");
  log::app::critical("d", "logged");
  CHECK_EQ(rec->identifiers(), (std::vector<std::string>{"c", "d"}));
}

TEST(observers filter by component) {
  install(event::severity_level::debug, event::component_type::dialer
                                          | event::component_type::framing);
  log::app::info("a", "not logged");
  log::dialer::info("b", "logged");
  log::timers::info("c", "not logged");
  log::framing::info("d", "logged");
  CHECK_EQ(rec->identifiers(), (std::vector<std::string>{"b", "d"}));
}

TEST(log_enabled reflects the filter of the current observer) {
  CHECK(!log_enabled(event::severity_level::critical,
                     event::component_type::app));
  install(event::severity_level::info,
          event::nil_component_mask | event::component_type::timers);
  CHECK(log_enabled(event::severity_level::info,
                    event::component_type::timers));
  CHECK(!log_enabled(event::severity_level::debug,
                     event::component_type::timers));
  CHECK(!log_enabled(event::severity_level::info,
                     event::component_type::app));
}

TEST(scoped loggers restore the previous observer) {
  install(event::severity_level::debug);
  {
    auto inner = std::make_shared<recorder>(event::severity_level::debug,
                                            event::default_component_mask);
    scoped_logger guard{inner};
    CHECK(logger() == inner.get());
    log::app::info("inner", "goes to the inner observer");
    CHECK_EQ(inner->identifiers(), (std::vector<std::string>{"inner"}));
  }
  CHECK(logger() == rec.get());
  log::app::info("outer", "goes to the outer observer");
  CHECK_EQ(rec->identifiers(), (std::vector<std::string>{"outer"}));
}

TEST(components report their activity) {
  install(event::severity_level::debug,
          event::nil_component_mask | event::component_type::dialer);
  auto tr = std::make_shared<fake_transport>(mpx);
  dialer uut{mpx, tr};
  auto alice = peer_id::random(1);
  uut.queue_dial(alice, "gossip/0");
  uut.abort_dial(alice);
  auto ids = rec->identifiers();
  CHECK(std::find(ids.begin(), ids.end(), "queue-dial") != ids.end());
  CHECK(std::find(ids.begin(), ids.end(), "abort-dial") != ids.end());
}

TEST(console loggers parse severity names) {
  CHECK(make_console_logger("debug") != nullptr);
  CHECK(make_console_logger("critical") != nullptr);
  auto threw = false;
  try {
    make_console_logger("chatty");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  CHECK(threw);
  auto ptr = make_console_logger(event::severity_level::error);
  CHECK(ptr->accepts(event::severity_level::critical,
                     event::component_type::app));
  CHECK(!ptr->accepts(event::severity_level::info,
                      event::component_type::app));
}

FIXTURE_SCOPE_END()
