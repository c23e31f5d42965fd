#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace tst::engine {

/**
 * \brief What to run and under which limits.
 */
struct ProcessRequest {
    std::vector<std::string> argv;           ///< argv[0] is resolved through PATH when it has no slash
    std::string input;                       ///< written to stdin, which is then closed
    std::chrono::milliseconds timeout{5000}; ///< wall-clock deadline, armed right before spawning
    std::filesystem::path working_directory{};
    std::size_t max_output_bytes{16U * 1024U * 1024U};  ///< per stream; excess is drained and dropped
};

/**
 * \brief Outcome of one supervised child.
 *
 * On timeout the captured streams are discarded and exit_status is left at 0.
 * A child killed by a signal reports the negated signal number.
 */
struct ProcessResult {
    bool timed_out{false};
    int exit_status{0};
    std::string stdout_text;
    std::string stderr_text;
    bool output_truncated{false};
};

/**
 * \brief Spawns one child with separate stdio pipes and reclaims it by its deadline.
 *
 * run() never leaves the child's process group behind: on expiry the whole
 * group is sent SIGKILL and the child reaped before the pending reads are
 * abandoned, and after a normal exit whatever the child left running in its
 * group is sent SIGKILL too. SIGPIPE is blocked only for the calling thread
 * while the child is fed, so concurrent supervisors do not share signal state.
 */
class ProcessSupervisor {
public:
    ProcessSupervisor() = default;

    /// Throws SpawnError when the child cannot be started.
    [[nodiscard]] ProcessResult run(const ProcessRequest& request) const;
};

}  // namespace tst::engine
