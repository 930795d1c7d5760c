#pragma once

#include "directup/core/result.hpp"

#include <string>

namespace directup {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

/// Applies level and pattern to the global spdlog logger.
directup::Result<void> configure_logging(const LoggingConfig& config);

} // namespace directup
