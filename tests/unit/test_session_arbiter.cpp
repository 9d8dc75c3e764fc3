#include <catch2/catch_test_macros.hpp>
#include "agentrelay/session/session_arbiter.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <fstream>
#include <thread>

using namespace agentrelay::session;
using namespace std::chrono_literals;
using agentrelay::testing::FakeMemoryStore;
using agentrelay::testing::ScriptedAgent;
using agentrelay::testing::TempDir;

namespace {

const agentrelay::response::PatternLibrary& patterns() {
    static const agentrelay::response::PatternLibrary library = agentrelay::response::PatternLibrary::builtin();
    return library;
}

Config arbiter_config(const fs::path& dir) {
    Config config;
    config.poller.interval_ms = 5;
    config.poller.timeout_ms = 2000;
    config.arbiter.lock_timeout_ms = 50;
    config.arbiter.context_reset_timeout_ms = 500;
    config.composer.include_time = false;
    config.composer.artifact_dir = dir / "context";
    return config;
}

TurnRequest request(const std::string& text, const std::string& context = "default") {
    TurnRequest r;
    r.text = text;
    r.context_id = context;
    r.destination = "test";
    return r;
}

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

}  // namespace

TEST_CASE("Turn completes with the sanitized reply", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    std::optional<TurnResult> delivered;
    auto req = request("ping");
    req.deliver = [&delivered](const TurnResult& result) { delivered = result; };

    auto result = arbiter.run_turn(req);
    REQUIRE(result.outcome == TurnOutcome::Completed);
    REQUIRE(result.text == "pong");
    REQUIRE(result.strategy == "marker");
    REQUIRE_FALSE(result.leak_detected);
    REQUIRE(result.turn_id.rfind("turn_", 0) == 0);

    REQUIRE(delivered.has_value());
    REQUIRE(delivered->text == "pong");

    REQUIRE_FALSE(arbiter.lock().is_held());
    REQUIRE(arbiter.handle().loaded_context == "default");
    REQUIRE(arbiter.recent().size("default") == 1);

    auto sent = agent.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].find("## Current Message\nping (ref R-") != std::string::npos);
}

TEST_CASE("Recent exchanges are carried into the next prompt", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    REQUIRE(arbiter.run_turn(request("ping")).ok());
    REQUIRE(arbiter.run_turn(request("again")).ok());

    auto sent = agent.sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1].find("## Recent Conversation\n**User:** ping\n**Assistant:** pong") != std::string::npos);
}

TEST_CASE("Large prompts are submitted through an artifact", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    auto config = arbiter_config(dir.path());
    config.composer.inline_threshold = 10;
    SessionArbiter arbiter(config, agent, patterns());

    auto result = arbiter.run_turn(request("summarize the week"));
    REQUIRE(result.outcome == TurnOutcome::Completed);
    REQUIRE(result.text == "pong");

    auto sent = agent.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].rfind("Read ", 0) == 0);
    REQUIRE(sent[0].find("Current Message section.") != std::string::npos);
}

TEST_CASE("Second requester gets busy while a turn is in flight", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.hold = true;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    TurnResult first;
    std::thread worker([&] { first = arbiter.run_turn(request("long job")); });

    for (int i = 0; i < 200 && !arbiter.lock().is_held(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(arbiter.lock().is_held());

    bool delivered_busy = false;
    auto second = request("ping");
    second.deliver = [&delivered_busy](const TurnResult& r) { delivered_busy = r.outcome == TurnOutcome::Busy; };
    auto result = arbiter.run_turn(second);
    REQUIRE(result.outcome == TurnOutcome::Busy);
    REQUIRE(delivered_busy);

    agent.hold = false;
    worker.join();
    REQUIRE(first.outcome == TurnOutcome::Completed);

    auto status = arbiter.status();
    REQUIRE(status["busy"] == 1);
    REQUIRE(status["turns"] == 1);
    REQUIRE(agent.sent().size() == 1);
}

TEST_CASE("Exceptions during a turn release the lock", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.throw_on_capture = true;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    auto result = arbiter.run_turn(request("ping"));
    REQUIRE(result.outcome == TurnOutcome::Errored);
    REQUIRE(result.error.has_value());
    REQUIRE_FALSE(arbiter.lock().is_held());
    REQUIRE(arbiter.lock().acquisitions() == 1);
    REQUIRE(arbiter.lock().releases() == 1);

    agent.throw_on_capture = false;
    REQUIRE(arbiter.run_turn(request("ping")).ok());
}

TEST_CASE("Switching context resets the session first", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    REQUIRE(arbiter.run_turn(request("ping", "chat")).ok());
    REQUIRE(arbiter.run_turn(request("ping", "chat")).ok());
    REQUIRE_FALSE(contains(agent.sent(), "/clear"));

    auto result = arbiter.run_turn(request("run report", "job:nightly"));
    REQUIRE(result.outcome == TurnOutcome::Completed);

    auto sent = agent.sent();
    REQUIRE(sent.size() == 4);
    REQUIRE(sent[2] == "/clear");
    REQUIRE(arbiter.handle().loaded_context == "job:nightly");

    // History of one context never leaks into another
    REQUIRE(sent[3].find("Recent Conversation") == std::string::npos);
}

TEST_CASE("Reset that never settles fails the turn", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    auto config = arbiter_config(dir.path());
    config.arbiter.context_reset_timeout_ms = 100;
    SessionArbiter arbiter(config, agent, patterns());

    REQUIRE(arbiter.run_turn(request("ping", "chat")).ok());

    agent.reset_hangs = true;
    auto result = arbiter.run_turn(request("run report", "job:nightly"));
    REQUIRE(result.outcome == TurnOutcome::ContextResetFailed);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->code == ErrorCode::ContextResetFailed);
    REQUIRE(agent.sent().back() == "/clear");
    REQUIRE_FALSE(arbiter.lock().is_held());
}

TEST_CASE("Freshly restarted session skips the reset", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    REQUIRE(arbiter.run_turn(request("ping", "chat")).ok());

    agent.restart_next = true;
    REQUIRE(arbiter.run_turn(request("run report", "job:nightly")).ok());
    REQUIRE_FALSE(contains(agent.sent(), "/clear"));
    REQUIRE(arbiter.handle().loaded_context == "job:nightly");
}

TEST_CASE("Empty response is retried once after an interrupt", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.replies = {"", "pong"};
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    auto result = arbiter.run_turn(request("ping"));
    REQUIRE(result.outcome == TurnOutcome::Completed);
    REQUIRE(result.text == "pong");
    REQUIRE(contains(agent.keys(), "C-c"));
    REQUIRE(agent.sent().size() == 2);
}

TEST_CASE("Persistently empty response is reported", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.replies = {"", ""};
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    auto result = arbiter.run_turn(request("ping"));
    REQUIRE(result.outcome == TurnOutcome::EmptyResponse);
    REQUIRE(result.text.empty());
    REQUIRE(arbiter.recent().size("default") == 0);
}

TEST_CASE("Memory store outage never affects turns", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    FakeMemoryStore remote;
    remote.fail_forward = true;

    agentrelay::memory::CaptureStore store(dir.path() / "data", 100, std::chrono::hours(24));
    REQUIRE(store.open().is_ok());
    agentrelay::memory::RetryQueue queue(dir.path() / "data", 3, 100, 1000ms);
    BreakerConfig breaker_config;
    breaker_config.failure_threshold = 5;
    agentrelay::memory::CircuitBreaker breaker(breaker_config);
    agentrelay::memory::CaptureForwarder forwarder(store, queue, breaker, &remote, 1000ms);

    MemoryStoreConfig memory_config;
    agentrelay::context::MemoryContextProvider provider(&remote, memory_config);

    ArbiterServices services;
    services.memory_context = &provider;
    services.forwarder = &forwarder;
    services.breaker = &breaker;
    services.retry_queue = &queue;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns(), services);

    for (int i = 0; i < 5; ++i) {
        auto result = arbiter.run_turn(request("ping " + std::to_string(i)));
        REQUIRE(result.outcome == TurnOutcome::Completed);
        forwarder.process_inbox();
    }

    REQUIRE(breaker.state() == agentrelay::memory::CircuitState::Open);
    REQUIRE(store.size() == 5);
    REQUIRE(queue.size() == 5);
    REQUIRE(agent.sent()[0].find("## Memory Context\nUser prefers short answers.") != std::string::npos);

    auto status = arbiter.status();
    REQUIRE(status["breaker"]["state"] == "open");
    REQUIRE(status["retry_queue"].is_object());

    // Still answering with the breaker open
    REQUIRE(arbiter.run_turn(request("ping")).ok());
}

TEST_CASE("Status reports the session and lock", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());
    REQUIRE(arbiter.run_turn(request("ping", "chat")).ok());

    auto status = arbiter.status();
    REQUIRE(status["session"] == "agent");
    REQUIRE(status["loaded_context"] == "chat");
    REQUIRE(status["lock_held"] == false);
    REQUIRE(status["turns"] == 1);
    REQUIRE(status["shutting_down"] == false);
    REQUIRE_FALSE(status.contains("breaker"));
}

TEST_CASE("Shutdown refuses new turns", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    arbiter.shutdown();
    REQUIRE(arbiter.shutting_down());

    auto result = arbiter.run_turn(request("ping"));
    REQUIRE(result.outcome == TurnOutcome::Errored);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->code == ErrorCode::Cancelled);
    REQUIRE(agent.sent().empty());
}

TEST_CASE("Forwarded records carry the requester's own message", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    FakeMemoryStore remote;

    agentrelay::memory::CaptureStore store(dir.path() / "data", 100, std::chrono::hours(24));
    REQUIRE(store.open().is_ok());
    agentrelay::memory::RetryQueue queue(dir.path() / "data", 3, 100, 1000ms);
    agentrelay::memory::CircuitBreaker breaker(BreakerConfig{});
    agentrelay::memory::CaptureForwarder forwarder(store, queue, breaker, &remote, 1000ms);

    MemoryStoreConfig memory_config;
    agentrelay::context::MemoryContextProvider provider(&remote, memory_config, &breaker);

    ArbiterServices services;
    services.memory_context = &provider;
    services.forwarder = &forwarder;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns(), services);

    REQUIRE(arbiter.run_turn(request("ping")).ok());
    forwarder.process_inbox();

    REQUIRE(remote.records.size() == 1);
    const auto& record = remote.records[0];
    REQUIRE(record.request == "ping");
    REQUIRE(record.prompt.find("## Memory Context") != std::string::npos);
    REQUIRE(record.prompt.find("## Current Message\nping") != std::string::npos);
    REQUIRE(record.sanitized == "pong");
}

TEST_CASE("Slow memory context fetch does not hold the session", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    FakeMemoryStore remote;
    MemoryStoreConfig memory_config;
    memory_config.cache_ttl_ms = 60000;
    agentrelay::context::MemoryContextProvider provider(&remote, memory_config);

    ArbiterServices services;
    services.memory_context = &provider;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns(), services);

    // Warm the cache for the second requester's query
    REQUIRE(provider.fetch("ping") == "User prefers short answers.");

    remote.stall = true;
    TurnResult slow;
    std::thread worker([&] { slow = arbiter.run_turn(request("weather report")); });

    for (int i = 0; i < 200 && !remote.fetching.load(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(remote.fetching.load());
    REQUIRE_FALSE(arbiter.lock().is_held());

    auto served = arbiter.run_turn(request("ping"));
    REQUIRE(served.outcome == TurnOutcome::Completed);
    REQUIRE(served.text == "pong");

    remote.stall = false;
    worker.join();
    REQUIRE(slow.outcome == TurnOutcome::Completed);
    REQUIRE(arbiter.status()["busy"] == 0);
}

TEST_CASE("Poll timeout keeps the partial reply and frees the session", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.hold = true;
    agent.partial = "Drafting the weekly summary";
    auto config = arbiter_config(dir.path());
    config.poller.timeout_ms = 200;
    SessionArbiter arbiter(config, agent, patterns());

    auto result = arbiter.run_turn(request("summarize the week"));
    REQUIRE(result.outcome == TurnOutcome::TimedOut);
    REQUIRE(result.text.find("Drafting the weekly summary") != std::string::npos);
    REQUIRE(result.text.find("Thinking") == std::string::npos);
    REQUIRE_FALSE(arbiter.lock().is_held());
    REQUIRE(arbiter.recent().size("default") == 0);

    // Timeouts are final, no resubmission
    REQUIRE(agent.sent().size() == 1);
    REQUIRE(agent.keys().empty());
}

TEST_CASE("Confirmation dialog is reported, never answered", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.ask_permission = true;
    SessionArbiter arbiter(arbiter_config(dir.path()), agent, patterns());

    std::optional<TurnResult> delivered;
    auto req = request("clean the build");
    req.deliver = [&delivered](const TurnResult& result) { delivered = result; };

    auto result = arbiter.run_turn(req);
    REQUIRE(result.outcome == TurnOutcome::PermissionRequested);
    REQUIRE(delivered.has_value());
    REQUIRE(delivered->outcome == TurnOutcome::PermissionRequested);
    REQUIRE_FALSE(arbiter.lock().is_held());

    // Nothing typed after the request itself
    REQUIRE(agent.sent().size() == 1);
    REQUIRE(agent.keys().empty());
}

TEST_CASE("Shutdown during a poll cancels the turn and frees the session", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    agent.hold = true;
    auto config = arbiter_config(dir.path());
    config.poller.timeout_ms = 60000;
    SessionArbiter arbiter(config, agent, patterns());

    TurnResult result;
    std::thread worker([&] { result = arbiter.run_turn(request("long job")); });

    for (int i = 0; i < 200 && !arbiter.lock().is_held(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(arbiter.lock().is_held());

    auto started = std::chrono::steady_clock::now();
    arbiter.shutdown();
    worker.join();

    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
    REQUIRE(result.outcome == TurnOutcome::Errored);
    REQUIRE(result.error.has_value());
    REQUIRE(result.error->code == ErrorCode::Cancelled);
    REQUIRE_FALSE(arbiter.lock().is_held());
    REQUIRE(arbiter.lock().releases() == 1);
}

TEST_CASE("Turn still runs when the artifact cannot be written", "[arbiter]") {
    TempDir dir;
    ScriptedAgent agent;
    auto config = arbiter_config(dir.path());
    config.composer.inline_threshold = 10;
    config.composer.artifact_dir = dir.path() / "blocked";
    {
        std::ofstream out(config.composer.artifact_dir);
        out << "not a directory";
    }
    SessionArbiter arbiter(config, agent, patterns());

    auto result = arbiter.run_turn(request("summarize the week"));
    REQUIRE(result.outcome == TurnOutcome::Completed);
    REQUIRE(result.text == "pong");

    auto sent = agent.sent();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].rfind("Read ", 0) == std::string::npos);
    REQUIRE(sent[0].find("## Current Message\nsummarize the week (ref R-") != std::string::npos);
}
