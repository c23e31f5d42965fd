#include "tst_engine/engine.hpp"
#include "tst_engine/errors.hpp"
#include "tst_engine/spawn_retry.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

using tst::engine::RunResult;
using tst::engine::Status;
using tst::engine::TestCase;

RunResult make_result(const TestCase& test) {
    RunResult result;
    result.type = test.type();
    result.name = test.display_name();
    result.index = test.index();
    if (test.type() == tst::engine::TestType::Io) {
        result.input = test.input();
        result.output = test.output();
    } else {
        result.script = test.script();
    }
    return result;
}

void finish(RunResult& result, Status status) {
    result.status = status;
    result.summary = std::string(1, tst::engine::summary_char(status));
}

void record_launch_failure(RunResult& result, const std::string& subject, const std::exception& ex) {
    spdlog::error("{}: unable to run test {}: {}", subject, result.name, ex.what());
    result.stderr_text = ex.what();
    finish(result, Status::DefaultError);
}

}  // namespace

namespace tst::engine {

Engine::Engine(Config config)
    : config_{std::move(config)},
      verifier_{script_bridge::Session::Config{
          .working_directory = config_.working_directory,
          .timeout = config_.timeout,
          .max_output_bytes = config_.max_output_bytes,
      }} {}

RunResult Engine::run(const TestCase& test, const std::string& subject) const {
    return test.type() == TestType::Io ? run_io(test, subject) : run_script(test, subject);
}

std::vector<std::string> Engine::subject_command(const std::string& subject) const {
    std::vector<std::string> argv;
    const fs::path path{subject};
    if (auto it = config_.interpreters.find(path.extension().string()); it != config_.interpreters.end()) {
        argv = it->second;
        argv.push_back(subject);
        return argv;
    }
    // A bare file name would otherwise be looked up through PATH.
    argv.push_back(path.has_parent_path() ? subject : "./" + subject);
    return argv;
}

RunResult Engine::run_io(const TestCase& test, const std::string& subject) const {
    RunResult result = make_result(test);

    ProcessRequest request;
    request.argv = subject_command(subject);
    request.input = test.input();
    request.timeout = config_.timeout;
    request.working_directory = config_.working_directory;
    request.max_output_bytes = config_.max_output_bytes;

    ProcessResult process;
    try {
        process = retry_transient_spawn(subject, [&] { return supervisor_.run(request); });
    } catch (const SpawnError& ex) {
        record_launch_failure(result, subject, ex);
        return result;
    } catch (const std::system_error& ex) {
        record_launch_failure(result, subject, ex);
        return result;
    }

    if (process.timed_out) {
        finish(result, Status::Timeout);
        return result;
    }

    result.stdout_text = std::move(process.stdout_text);
    result.stderr_text = std::move(process.stderr_text);
    result.exit_status = process.exit_status;

    if (process.exit_status != 0) {
        finish(result, detect_runtime_error(result.stderr_text).value_or(Status::DefaultError));
        return result;
    }

    finish(result, classify_output(test, result.stdout_text));
    return result;
}

RunResult Engine::run_script(const TestCase& test, const std::string& subject) const {
    RunResult result = make_result(test);

    script_bridge::Session::Outcome outcome;
    try {
        outcome = retry_transient_spawn(subject, [&] { return verifier_.verify(test.script(), subject); });
    } catch (const SpawnError& ex) {
        record_launch_failure(result, subject, ex);
        return result;
    } catch (const std::system_error& ex) {
        record_launch_failure(result, subject, ex);
        return result;
    }

    if (outcome.process.timed_out) {
        finish(result, Status::Timeout);
        return result;
    }

    result.stdout_text = std::move(outcome.process.stdout_text);
    result.stderr_text = std::move(outcome.process.stderr_text);
    result.exit_status = outcome.process.exit_status;

    if (outcome.process.exit_status != 0) {
        finish(result, Status::ScriptTestError);
        return result;
    }
    if (!outcome.report) {
        finish(result, Status::Inconclusive);
        return result;
    }

    const auto& summary = outcome.report->summary;
    const bool passed = !summary.empty() &&
                        std::all_of(summary.begin(), summary.end(), [](char ch) { return ch == kSuccessChar; });
    result.status = passed ? Status::Success : Status::Fail;
    result.summary = summary;
    result.feedback = outcome.report->feedback;
    return result;
}

bool tokens_in_sequence(std::string_view text, const std::vector<std::string>& tokens) {
    std::size_t pos = 0;
    for (const auto& token : tokens) {
        const auto found = text.find(token, pos);
        if (found == std::string_view::npos) {
            return false;
        }
        pos = found + token.size();
    }
    return true;
}

std::size_t count_occurrences(std::string_view text, std::string_view needle) {
    if (needle.empty()) {
        return 0;
    }
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string_view::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

Status classify_output(const TestCase& test, std::string_view observed) {
    const auto processed = test.preprocess(observed);
    if (processed == test.preprocessed_output()) {
        return Status::Success;
    }
    if (preprocess(observed, default_operators()) == test.normalized_output()) {
        return Status::QuasiSuccess;
    }

    const auto& tokens = test.tokens();
    if (tokens.empty()) {
        return Status::Fail;
    }
    if (tokens_in_sequence(processed, tokens)) {
        return Status::AllTokensSequence;
    }

    std::map<std::string, std::size_t> required;
    for (const auto& token : tokens) {
        ++required[token];
    }
    bool all_met = true;
    std::size_t found = 0;
    for (const auto& [token, needed] : required) {
        const auto present = count_occurrences(processed, token);
        all_met = all_met && present >= needed;
        found += std::min(present, needed);
    }
    if (all_met) {
        return Status::AllTokensMultiset;
    }
    return found > 0 ? Status::MissingTokens : Status::Fail;
}

}  // namespace tst::engine
