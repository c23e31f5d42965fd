#pragma once

#include "subject.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tst::engine {

enum class ReportFormat { Raw, Debug, Json, Summary };

[[nodiscard]] std::optional<ReportFormat> report_format_from_name(std::string_view name) noexcept;

/**
 * \brief Renders aggregated subjects in one of the report encodings.
 *
 * - raw: `<filename> <summaries(join_io) ...>` per subject, written as each subject completes.
 * - summary: `<filename> <success|fail>` per subject, written as each subject completes.
 * - json: one array with every subject, written once all subjects are done.
 * - debug: failing subjects and their failing runs only, with a line diff for `io` runs.
 */
class ReportWriter {
public:
    explicit ReportWriter(ReportFormat format);

    /// Called once per subject, in order, as soon as it is complete.
    void write_subject(std::ostream& out, const TestSubject& subject) const;

    /// Called once after every subject completed.
    void write_final(std::ostream& out, const std::vector<TestSubject>& subjects) const;

private:
    ReportFormat format_;
};

[[nodiscard]] std::string render_raw_line(const TestSubject& subject);
[[nodiscard]] std::string render_summary_line(const TestSubject& subject);
[[nodiscard]] std::string render_debug(const std::vector<TestSubject>& subjects);
[[nodiscard]] nlohmann::json subjects_to_json(const std::vector<TestSubject>& subjects);

/**
 * \brief LCS-based line diff of \p expected against \p observed.
 *
 * Lines are prefixed with `- ` (expected only), `+ ` (observed only) or two
 * spaces (common).
 */
[[nodiscard]] std::vector<std::string> line_diff(std::string_view expected, std::string_view observed);

}  // namespace tst::engine
