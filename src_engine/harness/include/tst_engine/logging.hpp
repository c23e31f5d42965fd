#pragma once

#include <optional>
#include <string>

namespace tst::engine {

/**
 * \brief Installs the `tst` logger (stderr, colour) as spdlog's default.
 *
 * The level defaults to `warn`, then `SPDLOG_LEVEL` is honoured, then
 * \p level when given. Throws std::invalid_argument on an unknown level name.
 */
void init_logging(const std::optional<std::string>& level = std::nullopt);

}  // namespace tst::engine
