#include "tst_engine/logging.hpp"

#include <stdexcept>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace tst::engine {

void init_logging(const std::optional<std::string>& level) {
    auto logger = spdlog::get("tst");
    if (!logger) {
        logger = spdlog::stderr_color_mt("tst");
    }
    logger->set_pattern("tst: [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    if (level) {
        const auto parsed = spdlog::level::from_str(*level);
        if (parsed == spdlog::level::off && *level != "off") {
            throw std::invalid_argument("unknown log level '" + *level + "'");
        }
        spdlog::set_level(parsed);
    }
}

}  // namespace tst::engine
