#include "agentrelay/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace agentrelay::core {

void init_logging(const ObservabilityConfig& config, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    // stdout carries turn results
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    try {
        fs::create_directories(config.log_path);
        auto file = (config.log_path / "agentrelay.log").string();
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file,
            static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024,
            static_cast<size_t>(config.max_files)));
    } catch (const std::exception& e) {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("agentrelay", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    auto level = spdlog::level::from_str(config.log_level);
    if (verbose) {
        level = spdlog::level::debug;
    }
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled ({}): {}", config.log_path.string(), file_error);
    }
}

}  // namespace agentrelay::core
