#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstddef>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

namespace tst::engine {

inline constexpr std::chrono::milliseconds kSpawnRetryPause{10};

/**
 * \brief Calls \p launch until it no longer fails with a transient SpawnError.
 *
 * There is no attempt limit. A permanent SpawnError, or any other exception,
 * propagates from the attempt that raised it. \p context names the subject
 * in the log.
 */
template <typename Fn>
auto retry_transient_spawn(std::string_view context, Fn&& launch,
                           std::chrono::milliseconds pause = kSpawnRetryPause) -> decltype(launch()) {
    for (std::size_t attempt = 1;; ++attempt) {
        try {
            return launch();
        } catch (const SpawnError& ex) {
            if (!ex.transient()) {
                throw;
            }
            spdlog::debug("{}: spawn attempt {} failed ({}), retrying", context, attempt, ex.what());
            std::this_thread::sleep_for(pause);
        }
    }
}

}  // namespace tst::engine
