#pragma once

#include "status.hpp"
#include "subprocess.hpp"
#include "test_case.hpp"
#include "tst_engine/script_bridge.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tst::engine {

/**
 * \brief Immutable record of one (subject, test case) run.
 *
 * `summary` is one status character for `io` runs; `script` runs keep the
 * verifier's own summary string verbatim. Streams stay empty on timeout.
 */
struct RunResult {
    TestType type{TestType::Io};
    std::string name;          ///< declared name or `#<n>`
    std::size_t index{0};      ///< position of the test case in its document
    Status status{Status::Fail};
    std::string summary;
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_status;
    std::string input;         ///< io: fed to stdin
    std::string output;        ///< io: expected output, markup removed
    std::string script;        ///< script: verifier command
    std::string feedback;      ///< script: free-form verifier feedback
};

/**
 * \brief Runs one test case against one subject and classifies the outcome.
 *
 * An Engine holds no per-run state, so one instance may be shared by several
 * worker threads. Every call returns a RunResult: spawn failures, timeouts and
 * crashes of the subject are all recorded rather than thrown.
 */
class Engine {
public:
    struct Config {
        std::chrono::milliseconds timeout{5000};
        /// Subject extension -> interpreter argv prefix. Unmapped subjects are executed directly.
        std::map<std::string, std::vector<std::string>> interpreters{
            {".py", {"python3"}},
            {".sh", {"sh"}},
        };
        std::size_t max_output_bytes{16U * 1024U * 1024U};
        std::filesystem::path working_directory{};
    };

    explicit Engine(Config config);

    [[nodiscard]] RunResult run(const TestCase& test, const std::string& subject) const;

    /// argv used to start \p subject, interpreter first when its extension is mapped.
    [[nodiscard]] std::vector<std::string> subject_command(const std::string& subject) const;

private:
    [[nodiscard]] RunResult run_io(const TestCase& test, const std::string& subject) const;
    [[nodiscard]] RunResult run_script(const TestCase& test, const std::string& subject) const;

    Config config_;
    ProcessSupervisor supervisor_;
    script_bridge::Session verifier_;
};

/**
 * \brief Classifies the stdout of a subject that exited cleanly.
 *
 * First match wins: Success (own operator set), QuasiSuccess (default set),
 * Fail when no tokens are declared, AllTokensSequence, AllTokensMultiset,
 * MissingTokens, Fail.
 */
[[nodiscard]] Status classify_output(const TestCase& test, std::string_view observed);

/// True when every token occurs in \p text, in order, without overlapping the previous one.
[[nodiscard]] bool tokens_in_sequence(std::string_view text, const std::vector<std::string>& tokens);

/// Non-overlapping occurrences of \p needle in \p text.
[[nodiscard]] std::size_t count_occurrences(std::string_view text, std::string_view needle);

}  // namespace tst::engine
