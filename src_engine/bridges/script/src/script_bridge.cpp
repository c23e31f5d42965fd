#include "tst_engine/script_bridge.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tst::engine::script_bridge {

using nlohmann::json;

static std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

static std::optional<VerifierReport> parse_json_report(const json& doc) {
    if (!doc.is_object()) return std::nullopt;
    auto summary = doc.find("summary");
    if (summary == doc.end() || !summary->is_string() || summary->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }

    VerifierReport report;
    report.summary = summary->get<std::string>();
    if (auto feedback = doc.find("feedback"); feedback != doc.end() && feedback->is_string()) {
        report.feedback = feedback->get<std::string>();
    }
    return report;
}

static std::optional<VerifierReport> parse_text_report(std::string_view text) {
    const auto lines = split_lines(text);
    if (lines.empty() || lines.front().empty()) return std::nullopt;
    if (lines.front().find(' ') != std::string_view::npos) return std::nullopt;

    VerifierReport report;
    report.summary = std::string{lines.front()};
    for (std::size_t i = 2; i < lines.size(); ++i) {
        if (i > 2) report.feedback += '\n';
        report.feedback += lines[i];
    }
    return report;
}

std::optional<VerifierReport> parse_report(std::string_view text) {
    if (text.empty()) return std::nullopt;

    const json doc = json::parse(text.begin(), text.end(), nullptr, false);
    if (!doc.is_discarded() && doc.is_object()) {
        return parse_json_report(doc);
    }
    return parse_text_report(text);
}

Session::Session(Config cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> Session::command_line(const std::string& script, const std::string& subject) {
    std::vector<std::string> argv;
    std::istringstream words(script);
    std::string word;
    while (words >> word) {
        argv.push_back(std::move(word));
    }
    argv.push_back(subject);
    return argv;
}

Session::Outcome Session::verify(const std::string& script, const std::string& subject) const {
    ProcessRequest request;
    request.argv = command_line(script, subject);
    request.timeout = cfg_.timeout;
    request.working_directory = cfg_.working_directory;
    request.max_output_bytes = cfg_.max_output_bytes;

    Outcome outcome;
    outcome.process = supervisor_.run(request);
    if (outcome.process.timed_out || outcome.process.exit_status != 0) {
        return outcome;
    }

    outcome.report = parse_report(outcome.process.stderr_text);
    if (!outcome.report) {
        outcome.report = parse_report(outcome.process.stdout_text);
    }
    if (!outcome.report) {
        spdlog::info("{}: verifier '{}' printed no report", subject, script);
    }
    return outcome;
}

} // namespace tst::engine::script_bridge
