#include "tst_engine/report_writer.hpp"

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using tst::engine::RunResult;
using tst::engine::Status;
using tst::engine::TestSubject;
using tst::engine::TestType;

// Above this many LCS cells the diff degrades to "all removed, all added".
constexpr std::size_t kMaxDiffCells = 4'000'000;

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

json run_to_json(const RunResult& run) {
    json entry = {
        {"type", std::string{tst::engine::to_string(run.type)}},
        {"name", run.name},
        {"status", std::string{tst::engine::to_string(run.status)}},
        {"summary", run.summary},
        {"stdout", run.stdout_text},
        {"stderr", run.stderr_text},
        {"exit_status", run.exit_status ? json(*run.exit_status) : json(nullptr)},
    };
    if (run.type == TestType::Io) {
        entry["input"] = run.input;
        entry["output"] = run.output;
    } else {
        entry["script"] = run.script;
        entry["feedback"] = run.feedback;
    }
    return entry;
}

void write_block(std::ostringstream& oss, std::string_view title, std::string_view text) {
    oss << "   " << title << ":\n";
    for (const auto line : split_lines(text)) {
        oss << "     " << line << "\n";
    }
}

void render_run(std::ostringstream& oss, const RunResult& run) {
    oss << "-- " << tst::engine::to_string(run.type) << " test " << run.name << " ["
        << tst::engine::to_string(run.status) << " " << run.summary << "]\n";

    if (run.status == Status::Timeout) {
        return;
    }

    if (run.type == TestType::Io) {
        if (!run.input.empty()) {
            write_block(oss, "input", run.input);
        }
        oss << "   diff (- expected, + observed):\n";
        for (const auto& line : tst::engine::line_diff(run.output, run.stdout_text)) {
            oss << "     " << line << "\n";
        }
    } else {
        oss << "   script: " << run.script << "\n";
        if (run.exit_status) {
            oss << "   exit status: " << *run.exit_status << "\n";
        }
        if (!run.stdout_text.empty()) {
            write_block(oss, "stdout", run.stdout_text);
        }
        if (!run.feedback.empty()) {
            write_block(oss, "feedback", run.feedback);
        }
    }
    if (!run.stderr_text.empty()) {
        write_block(oss, "stderr", run.stderr_text);
    }
}

}  // namespace

namespace tst::engine {

std::optional<ReportFormat> report_format_from_name(std::string_view name) noexcept {
    if (name == "raw") return ReportFormat::Raw;
    if (name == "debug") return ReportFormat::Debug;
    if (name == "json") return ReportFormat::Json;
    if (name == "summary") return ReportFormat::Summary;
    return std::nullopt;
}

std::vector<std::string> line_diff(std::string_view expected, std::string_view observed) {
    const auto a = split_lines(expected);
    const auto b = split_lines(observed);
    std::vector<std::string> out;

    auto emit = [&out](std::string_view prefix, std::string_view line) {
        std::string text{prefix};
        text += line;
        out.push_back(std::move(text));
    };

    if ((a.size() + 1) * (b.size() + 1) > kMaxDiffCells) {
        for (const auto line : a) emit("- ", line);
        for (const auto line : b) emit("+ ", line);
        return out;
    }

    // lcs[i][j]: LCS length of a[i..] and b[j..]
    std::vector<std::vector<std::size_t>> lcs(a.size() + 1, std::vector<std::size_t>(b.size() + 1, 0));
    for (std::size_t i = a.size(); i-- > 0;) {
        for (std::size_t j = b.size(); j-- > 0;) {
            lcs[i][j] = a[i] == b[j] ? lcs[i + 1][j + 1] + 1 : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] == b[j]) {
            emit("  ", a[i]);
            ++i;
            ++j;
        } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
            emit("- ", a[i++]);
        } else {
            emit("+ ", b[j++]);
        }
    }
    for (; i < a.size(); ++i) emit("- ", a[i]);
    for (; j < b.size(); ++j) emit("+ ", b[j]);
    return out;
}

std::string render_raw_line(const TestSubject& subject) {
    std::ostringstream oss;
    oss << subject.filename();
    for (const auto& summary : subject.summaries(true)) {
        oss << ' ' << summary;
    }
    return oss.str();
}

std::string render_summary_line(const TestSubject& subject) {
    return subject.filename() + " " + std::string{to_string(subject.verdict())};
}

std::string render_debug(const std::vector<TestSubject>& subjects) {
    std::ostringstream oss;
    for (const auto& subject : subjects) {
        if (subject.verdict() == Verdict::Success) {
            continue;
        }
        oss << "== " << subject.filename() << " " << subject.summary() << "\n";
        for (const auto& run : subject.runs()) {
            if (run.status != Status::Success) {
                render_run(oss, run);
            }
        }
        oss << "\n";
    }
    return oss.str();
}

json subjects_to_json(const std::vector<TestSubject>& subjects) {
    json doc = json::array();
    for (const auto& subject : subjects) {
        json results = json::array();
        for (const auto& run : subject.runs()) {
            results.push_back(run_to_json(run));
        }
        doc.push_back({
            {"filename", subject.filename()},
            {"verdict", std::string{to_string(subject.verdict())}},
            {"summary", subject.summary()},
            {"summaries", subject.summaries(true)},
            {"results", std::move(results)},
        });
    }
    return doc;
}

ReportWriter::ReportWriter(ReportFormat format) : format_{format} {}

void ReportWriter::write_subject(std::ostream& out, const TestSubject& subject) const {
    switch (format_) {
        case ReportFormat::Raw:
            out << render_raw_line(subject) << std::endl;
            break;
        case ReportFormat::Summary:
            out << render_summary_line(subject) << std::endl;
            break;
        case ReportFormat::Debug:
        case ReportFormat::Json:
            break;
    }
}

void ReportWriter::write_final(std::ostream& out, const std::vector<TestSubject>& subjects) const {
    switch (format_) {
        case ReportFormat::Debug:
            out << render_debug(subjects);
            break;
        case ReportFormat::Json:
            // Captured streams are arbitrary bytes; invalid UTF-8 becomes U+FFFD.
            out << subjects_to_json(subjects).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
            break;
        case ReportFormat::Raw:
        case ReportFormat::Summary:
            break;
    }
}

}  // namespace tst::engine
