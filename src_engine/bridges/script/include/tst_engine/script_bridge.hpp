#pragma once

#include "tst_engine/subprocess.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tst::engine::script_bridge
{

/**
 * Report printed by a verifier script.
 *
 * Two encodings are accepted on either stream:
 *  - a JSON object carrying a string `summary` and an optional string `feedback`;
 *  - plain text whose first line is the summary (it must not contain a space),
 *    followed by a blank line and free-form feedback from the third line on.
 */
struct VerifierReport
{
    std::string summary;
    std::string feedback;
};

/**
 * Parses one stream. A JSON object is only accepted as a JSON report;
 * everything else is tried as plain text. Returns nullopt when the
 * stream holds no report.
 */
[[nodiscard]] std::optional<VerifierReport> parse_report(std::string_view text);

/**
 * Verifier invocation: `<script words...> <subject-filename>`.
 *
 * The `script` field is split on whitespace so that interpreters can be
 * named explicitly (e.g. `python3 checks/style.py`).
 */
class Session
{
public:
    struct Config
    {
        // Directory the verifier runs in (empty = inherit).
        std::filesystem::path working_directory;

        // Wall-clock limit for one verifier run.
        std::chrono::milliseconds timeout{5000};

        // Per-stream capture limit.
        std::size_t max_output_bytes{16U * 1024U * 1024U};
    };

    struct Outcome
    {
        ProcessResult process;
        std::optional<VerifierReport> report;  // stderr first, then stdout; empty on timeout or failure
    };

    explicit Session(Config cfg);

    [[nodiscard]] static std::vector<std::string> command_line(const std::string& script,
                                                               const std::string& subject);

    /// Throws SpawnError when the verifier cannot be started.
    [[nodiscard]] Outcome verify(const std::string& script, const std::string& subject) const;

private:
    Config cfg_;
    ProcessSupervisor supervisor_;
};

} // namespace tst::engine::script_bridge
