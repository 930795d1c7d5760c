#include "directup/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace directup {

directup::Result<void> configure_logging(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    // from_str maps unknown names to off; only accept that when asked for.
    if (level == spdlog::level::off && config.level != "off") {
        return directup::Fail<void>(ErrorKind::Parse, "Unknown log level: " + config.level);
    }
    spdlog::set_level(level);
    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
    return directup::Ok();
}

} // namespace directup
