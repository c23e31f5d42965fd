#pragma once

#include "engine.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tst::engine {

enum class Verdict { Success, Fail };

[[nodiscard]] std::string_view to_string(Verdict verdict) noexcept;

/**
 * \brief One program under evaluation and its runs, in declaration order.
 *
 * summaries() is computed lazily and cached until the next add_run().
 */
class TestSubject {
public:
    explicit TestSubject(std::string filename);

    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
    [[nodiscard]] const std::vector<RunResult>& runs() const noexcept { return runs_; }

    void add_run(RunResult run);

    /**
     * Without join_io: every summary character of every run, one per entry.
     * With join_io: all `io` summaries concatenated into one leading entry
     * (omitted when there are no `io` runs), followed by each non-io run's
     * summary as its own entry.
     */
    [[nodiscard]] const std::vector<std::string>& summaries(bool join_io = false) const;

    /// Concatenation of all run summaries.
    [[nodiscard]] std::string summary() const;

    /// Success iff every summary character is the success character.
    [[nodiscard]] Verdict verdict() const;

private:
    std::string filename_;
    std::vector<RunResult> runs_;
    mutable std::optional<std::vector<std::string>> flat_summaries_;
    mutable std::optional<std::vector<std::string>> joined_summaries_;
};

}  // namespace tst::engine
