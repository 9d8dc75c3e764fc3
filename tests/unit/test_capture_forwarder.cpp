#include <catch2/catch_test_macros.hpp>
#include "agentrelay/memory/capture_forwarder.hpp"
#include "test_support.hpp"

#include <chrono>
#include <thread>

using namespace agentrelay::memory;
using namespace std::chrono_literals;
using agentrelay::testing::FakeMemoryStore;
using agentrelay::testing::TempDir;
using agentrelay::testing::make_record;

namespace {

struct Fixture {
    TempDir dir;
    CaptureStore store{dir.path(), 100, std::chrono::hours(24)};
    RetryQueue queue{dir.path(), 3, 100, 1000ms};
    CircuitBreaker breaker{[] {
        BreakerConfig c;
        c.failure_threshold = 2;
        c.cooldown_ms = 60000;
        return c;
    }()};
    FakeMemoryStore remote;

    Fixture() {
        auto opened = store.open();
        REQUIRE(opened.is_ok());
    }
};

}  // namespace

TEST_CASE("Completed turns are stored and forwarded", "[forwarder]") {
    Fixture f;
    CaptureForwarder forwarder(f.store, f.queue, f.breaker, &f.remote, 1000ms);

    auto now = Clock::now();
    forwarder.submit(make_record("a", TurnOutcome::Completed, now));
    forwarder.submit(make_record("b", TurnOutcome::TimedOut, now));
    REQUIRE(forwarder.inbox_size() == 2);

    REQUIRE(forwarder.process_inbox(now) == 2);
    REQUIRE(f.store.size() == 2);
    REQUIRE(f.remote.forwarded == std::vector<std::string>{"a"});
    REQUIRE(f.queue.size() == 0);
}

TEST_CASE("Failed forwards are queued and the breaker opens", "[forwarder]") {
    Fixture f;
    f.remote.fail_forward = true;
    CaptureForwarder forwarder(f.store, f.queue, f.breaker, &f.remote, 1000ms);

    auto now = Clock::now();
    for (const char* id : {"a", "b", "c"}) {
        forwarder.submit(make_record(id, TurnOutcome::Completed, now));
    }
    forwarder.process_inbox(now);

    // Two real attempts open the breaker, the third is queued without calling out
    REQUIRE(f.remote.forwards == 2);
    REQUIRE(f.breaker.state() == CircuitState::Open);
    REQUIRE(f.queue.size() == 3);
    REQUIRE(f.queue.get("a")->attempts == 1);
    REQUIRE(f.queue.get("c")->attempts == 0);
    REQUIRE(f.queue.get("c")->last_error == "Circuit breaker is open");
    REQUIRE(f.store.size() == 3);
}

TEST_CASE("Draining stops while the breaker is open", "[forwarder]") {
    Fixture f;
    CaptureForwarder forwarder(f.store, f.queue, f.breaker, &f.remote, 1000ms);

    auto now = Clock::now();
    f.queue.enqueue(make_record("a", TurnOutcome::Completed, now), now, 1, "down");
    f.breaker.force_open();

    REQUIRE(forwarder.drain_due(now + 10s) == 0);
    REQUIRE(f.remote.forwards == 0);
    REQUIRE(f.queue.get("a")->attempts == 1);

    f.breaker.force_close();
    REQUIRE(forwarder.drain_due(now + 10s) == 1);
    REQUIRE(f.queue.size() == 0);
    REQUIRE(f.queue.stats().forwarded == 1);
}

TEST_CASE("Retries are dropped at the attempt cap", "[forwarder]") {
    Fixture f;
    f.remote.fail_forward = true;
    CaptureForwarder forwarder(f.store, f.queue, f.breaker, &f.remote, 1000ms);

    auto now = Clock::now();
    f.queue.enqueue(make_record("a", TurnOutcome::Completed, now), now, 1, "down");

    forwarder.drain_due(now + 1h);
    REQUIRE(f.queue.get("a")->attempts == 2);

    forwarder.drain_due(now + 2h);
    REQUIRE(f.queue.size() == 0);
    REQUIRE(f.queue.stats().dropped == 1);
}

TEST_CASE("Without a memory store only the local copy is kept", "[forwarder]") {
    Fixture f;
    CaptureForwarder forwarder(f.store, f.queue, f.breaker, nullptr, 1000ms);

    forwarder.submit(make_record("a", TurnOutcome::Completed, Clock::now()));
    forwarder.process_inbox();

    REQUIRE(f.store.size() == 1);
    REQUIRE(f.queue.size() == 0);
    REQUIRE(forwarder.drain_due() == 0);
}

TEST_CASE("Background worker processes submissions and drains on stop", "[forwarder]") {
    Fixture f;
    CaptureForwarder forwarder(f.store, f.queue, f.breaker, &f.remote, 1000ms);

    forwarder.start();
    REQUIRE(forwarder.running());

    forwarder.submit(make_record("a", TurnOutcome::Completed, Clock::now()));
    for (int i = 0; i < 200 && f.store.size() < 1; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(f.store.size() == 1);

    forwarder.submit(make_record("b", TurnOutcome::Completed, Clock::now()));
    forwarder.stop();

    REQUIRE_FALSE(forwarder.running());
    REQUIRE(f.store.size() == 2);
    REQUIRE(forwarder.inbox_size() == 0);
}
