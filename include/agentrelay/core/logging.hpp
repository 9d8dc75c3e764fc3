#pragma once

#include "config.hpp"

namespace agentrelay::core {

// Install the default spdlog logger (stderr + rotating file) from config.
// Safe to call more than once; later calls replace the sinks.
void init_logging(const ObservabilityConfig& config, bool verbose = false);

}  // namespace agentrelay::core
