#include "agentrelay/context/memory_context_provider.hpp"
#include "agentrelay/core/config.hpp"
#include "agentrelay/core/logging.hpp"
#include "agentrelay/memory/capture_forwarder.hpp"
#include "agentrelay/memory/capture_store.hpp"
#include "agentrelay/memory/circuit_breaker.hpp"
#include "agentrelay/memory/memory_store.hpp"
#include "agentrelay/memory/retry_queue.hpp"
#include "agentrelay/response/pattern_library.hpp"
#include "agentrelay/response/sanitizer.hpp"
#include "agentrelay/session/session_arbiter.hpp"
#include "agentrelay/session/terminal.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace agentrelay;
using namespace agentrelay::core;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitTurnFailed = 2;

std::atomic<session::SessionArbiter*> g_arbiter{nullptr};

void on_signal(int) {
    if (auto* arbiter = g_arbiter.load()) {
        arbiter->shutdown();
    }
}

// No SA_RESTART, so a blocking read on stdin returns when the relay is stopped
void install_signal_handlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int print_result(const session::TurnResult& result) {
    switch (result.outcome) {
        case TurnOutcome::Completed:
            std::cout << result.text << std::endl;
            return kExitOk;
        case TurnOutcome::TimedOut:
            if (!result.text.empty()) {
                std::cout << result.text << std::endl;
            }
            std::cerr << "[timed out]" << std::endl;
            break;
        case TurnOutcome::Busy:
            std::cerr << "[session busy, try again shortly]" << std::endl;
            break;
        case TurnOutcome::PermissionRequested:
            std::cerr << "[agent is waiting for a permission decision]" << std::endl;
            break;
        case TurnOutcome::EmptyResponse:
            std::cerr << "[empty response]" << std::endl;
            break;
        case TurnOutcome::ContextResetFailed:
        case TurnOutcome::Errored:
            std::cerr << "[" << outcome_to_string(result.outcome) << "] "
                      << (result.error ? result.error->full_message() : std::string("unknown error"))
                      << std::endl;
            break;
    }
    return kExitTurnFailed;
}

// One JSON request per line in, one JSON result per line out
void run_json_line(session::SessionArbiter& arbiter, const session::TurnRequest& base, const std::string& line) {
    Json parsed = Json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        Error error{ErrorCode::InvalidArgument, "Request line is not valid JSON"};
        std::cout << Json{{"outcome", "rejected"}, {"error", error.full_message()},
                          {"error_code", static_cast<int>(error.code)}}.dump() << std::endl;
        return;
    }

    auto request = session::TurnRequest::from_json(parsed, base);
    if (request.is_err()) {
        spdlog::warn("Rejected request: {}", request.error().full_message());
        std::cout << Json{{"outcome", "rejected"}, {"error", request.error().full_message()},
                          {"error_code", static_cast<int>(request.error().code)}}.dump() << std::endl;
        return;
    }

    std::cout << arbiter.run_turn(request.value()).to_json().dump() << std::endl;
}

Result<response::PatternLibrary, Error> load_patterns(const PatternsConfig& config) {
    if (config.file.empty()) {
        return Result<response::PatternLibrary, Error>::ok(response::PatternLibrary::builtin());
    }
    return response::PatternLibrary::load(config.file);
}

}  // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("agentrelay", "Serialized relay into an interactive agent session");

    options.add_options()                                                                 //
        ("c,config", "Configuration file", cxxopts::value<std::string>())               //
        ("status", "Print relay status as JSON")                                         //
        ("send", "Run a single turn with this text", cxxopts::value<std::string>())      //
        ("context", "Context id for turns", cxxopts::value<std::string>()->default_value("default"))  //
        ("destination", "Delivery target label", cxxopts::value<std::string>()->default_value("cli"))  //
        ("job", "Run turns as a scheduled job")                                          //
        ("exempt-quiet-hours", "Mark job turns as exempt from quiet hours")              //
        ("raw", "Skip chrome and leak filtering")                                        //
        ("capture", "Print the current session screen, cleaned")                         //
        ("retry-now", "Drain due memory-store retries once and exit")                    //
        ("v,verbose", "Debug logging")                                                   //
        ("h,help", "Print help");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return kExitConfig;
    }
    const auto& args = *parsed;

    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return kExitOk;
    }

    Config config;
    if (args.count("config")) {
        auto loaded = Config::load(fs::path(args["config"].as<std::string>()));
        if (loaded.is_err()) {
            std::cerr << "Config error: " << loaded.error().full_message() << std::endl;
            return kExitConfig;
        }
        config = std::move(loaded).value();
    } else {
        config = Config::load_or_default(Config::default_path());
    }

    init_logging(config.observability, args.count("verbose") > 0);

    auto patterns = load_patterns(config.patterns);
    if (patterns.is_err()) {
        spdlog::error("Pattern table: {}", patterns.error().full_message());
        return kExitConfig;
    }
    spdlog::debug("Pattern table {} with {} rules", patterns.value().version(), patterns.value().size());

    session::TmuxTerminal terminal(config.session);

    if (args.count("capture")) {
        auto screen = terminal.capture();
        if (screen.is_err()) {
            spdlog::error("Capture failed: {}", screen.error().full_message());
            return kExitTurnFailed;
        }
        response::Sanitizer sanitizer(patterns.value());
        std::cout << sanitizer.sanitize(screen.value(), args.count("raw") > 0).text << std::endl;
        return kExitOk;
    }

    // Persistence and the memory-store path
    memory::CaptureStore store(config.capture.data_dir,
                               static_cast<size_t>(config.capture.max_records),
                               std::chrono::hours(24 * config.capture.max_age_days));
    auto opened = store.open();
    if (opened.is_err()) {
        spdlog::error("Capture store unavailable: {}", opened.error().full_message());
    }

    memory::RetryQueue queue(config.capture.data_dir,
                             config.capture.retry_max_attempts,
                             static_cast<size_t>(config.capture.retry_queue_max),
                             Duration(config.capture.retry_interval_ms));
    auto queued = queue.load();
    if (queued.is_err()) {
        spdlog::error("Retry queue unavailable: {}", queued.error().full_message());
    }

    memory::CircuitBreaker breaker(config.breaker);

    std::unique_ptr<memory::HttpMemoryStore> remote;
    if (config.memory_store.enabled) {
        remote = std::make_unique<memory::HttpMemoryStore>(config.memory_store);
    }

    memory::CaptureForwarder forwarder(store, queue, breaker, remote.get(),
                                       Duration(config.capture.retry_interval_ms));

    if (args.count("retry-now")) {
        size_t forwarded = forwarder.drain_due(Clock::now());
        std::cout << queue.stats().to_json().dump(2) << std::endl;
        spdlog::info("Retry pass handled {} entries", forwarded);
        return kExitOk;
    }

    context::MemoryContextProvider memory_context(remote.get(), config.memory_store, &breaker);
    session::SessionStateFile shared_state(config.capture.data_dir);

    session::ArbiterServices services;
    services.memory_context = &memory_context;
    services.forwarder = &forwarder;
    services.breaker = &breaker;
    services.retry_queue = &queue;
    services.shared_state = &shared_state;

    session::SessionArbiter arbiter(config, terminal, patterns.value(), services);

    if (args.count("status")) {
        Json status = arbiter.status();
        status["session_exists"] = terminal.exists();
        status["capture_store"] = store.stats().to_json();
        auto persisted = shared_state.load();
        if (persisted.is_ok()) {
            status["shared_state"] = persisted.value().to_json();
        }
        std::cout << status.dump(2) << std::endl;
        return kExitOk;
    }

    g_arbiter.store(&arbiter);
    install_signal_handlers();
    forwarder.start();

    session::TurnRequest base;
    base.requester = args.count("job") ? RequesterKind::ScheduledJob : RequesterKind::Conversational;
    base.context_id = args["context"].as<std::string>();
    base.destination = args["destination"].as<std::string>();
    base.exempt_quiet_hours = args.count("exempt-quiet-hours") > 0;
    base.raw = args.count("raw") > 0;
    base.progress = [](Duration elapsed) {
        std::cerr << "[still working, " << elapsed.count() / 1000 << "s]" << std::endl;
    };

    int exit_code = kExitOk;
    if (args.count("send")) {
        auto request = base;
        request.text = args["send"].as<std::string>();
        exit_code = print_result(arbiter.run_turn(request));
    } else {
        std::string line;
        while (!arbiter.shutting_down() && std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            if (line[line.find_first_not_of(" \t")] == '{') {
                run_json_line(arbiter, base, line);
                continue;
            }
            auto request = base;
            request.text = line;
            print_result(arbiter.run_turn(request));
        }
    }

    g_arbiter.store(nullptr);
    forwarder.stop();
    return exit_code;
}
