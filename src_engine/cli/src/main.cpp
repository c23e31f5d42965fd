#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tst_engine/batch_runner.hpp"
#include "tst_engine/discovery.hpp"
#include "tst_engine/engine.hpp"
#include "tst_engine/errors.hpp"
#include "tst_engine/logging.hpp"
#include "tst_engine/report_writer.hpp"
#include "tst_engine/test_case.hpp"
#include "tst_engine/test_loader.hpp"

using tst::engine::BatchRunner;
using tst::engine::Engine;
using tst::engine::EnvironmentError;
using tst::engine::ReportFormat;
using tst::engine::ReportWriter;
using tst::engine::TestCase;
using tst::engine::TestLoader;
using tst::engine::TestSubject;

namespace {

constexpr std::string_view kOneLineHelp = "run the declared tests against one or more subject programs";

// One day.
constexpr double kMaxTimeoutSeconds = 86400.0;

struct Args {
    std::vector<std::string> subjects;
    double timeout_seconds{5.0};
    ReportFormat format{ReportFormat::Raw};
    std::filesystem::path tests_file{};
    std::size_t jobs{1};
    std::optional<std::string> log_level;
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "Usage:\n"
        << "  " << argv0 << " [filename|glob ...] [-t SECONDS] [-o raw|debug|json|summary]\n"
        << "        [-f FILE] [-j N] [--log-level LEVEL]\n"
        << "\n"
        << "Options:\n"
        << "  -t, --timeout    Wall-clock limit per test run in seconds (default: 5).\n"
        << "  -o, --output     Report format: raw, debug, json or summary (default: raw).\n"
        << "  -f, --tests      Test document (default: tst.yaml, tst.yml or tst.json).\n"
        << "  -j, --jobs       Number of runs executed in parallel (default: 1).\n"
        << "  --log-level      trace, debug, info, warn, error, critical or off.\n"
        << "  --one-line-help  Print a one-line description and exit.\n"
        << "  -h, --help       Show this help message.\n"
        << "\n"
        << "Without filenames, every *.py and *.sh file in the current directory is tested.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::string expect_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "-t") || arg_eq(tok, "--timeout")) {
            const auto value = expect_value(argc, argv, i, tok);
            std::size_t used = 0;
            double seconds = 0.0;
            try {
                seconds = std::stod(value, &used);
            } catch (const std::exception&) {
                used = 0;
            }
            if (used != value.size() || !(seconds > 0.0)) {
                throw std::invalid_argument("invalid timeout '" + value + "'");
            }
            if (seconds > kMaxTimeoutSeconds) {
                throw std::invalid_argument("timeout '" + value + "' exceeds " +
                                            std::to_string(static_cast<int>(kMaxTimeoutSeconds)) + " seconds");
            }
            args.timeout_seconds = seconds;
        } else if (arg_eq(tok, "-o") || arg_eq(tok, "--output")) {
            const auto value = expect_value(argc, argv, i, tok);
            const auto format = tst::engine::report_format_from_name(value);
            if (!format) {
                throw std::invalid_argument("invalid output format '" + value + "'");
            }
            args.format = *format;
        } else if (arg_eq(tok, "-f") || arg_eq(tok, "--tests")) {
            args.tests_file = expect_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "-j") || arg_eq(tok, "--jobs")) {
            const auto value = expect_value(argc, argv, i, tok);
            int jobs = 0;
            try {
                jobs = std::stoi(value);
            } catch (const std::exception&) {
                jobs = 0;
            }
            if (jobs < 1) {
                throw std::invalid_argument("invalid job count '" + value + "'");
            }
            args.jobs = static_cast<std::size_t>(jobs);
        } else if (arg_eq(tok, "--log-level")) {
            args.log_level = expect_value(argc, argv, i, tok);
        } else if (tok.size() > 1 && tok.front() == '-') {
            throw std::invalid_argument("unknown option '" + std::string{tok} + "'");
        } else {
            args.subjects.emplace_back(tok);
        }
    }
    return args;
}

std::vector<TestCase> load_tests(const Args& args) {
    TestLoader loader;
    auto document_path = args.tests_file;
    if (document_path.empty()) {
        const auto found = loader.discover(std::filesystem::current_path());
        if (!found) {
            throw EnvironmentError("no test document found (tst.yaml, tst.yml or tst.json)");
        }
        document_path = *found;
    }

    const auto document = loader.load(document_path);
    std::vector<TestCase> tests;
    tests.reserve(document.tests.size());
    for (std::size_t i = 0; i < document.tests.size(); ++i) {
        tests.emplace_back(document.tests[i], i);
    }
    if (tests.empty()) {
        throw EnvironmentError("no tests declared in " + document.source_file);
    }
    return tests;
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (arg_eq(argv[i], "--one-line-help")) {
            std::cout << kOneLineHelp << std::endl;
            return 0;
        }
    }

    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }
        tst::engine::init_logging(args.log_level);

        const auto tests = load_tests(args);

        Engine::Config config;
        config.timeout = std::chrono::milliseconds(static_cast<long long>(args.timeout_seconds * 1000.0));

        std::set<std::string> extensions;
        for (const auto& [extension, interpreter] : config.interpreters) {
            extensions.insert(extension);
        }
        const auto subjects = tst::engine::resolve_subjects(args.subjects, std::filesystem::current_path(),
                                                            extensions);
        if (subjects.empty()) {
            throw EnvironmentError("no subject files found");
        }

        const Engine engine(std::move(config));
        const BatchRunner runner(engine, BatchRunner::Config{.jobs = args.jobs});
        const ReportWriter writer(args.format);

        const auto results = runner.run(subjects, tests, [&writer](const TestSubject& subject) {
            writer.write_subject(std::cout, subject);
        });
        writer.write_final(std::cout, results);
        return 0;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "tst: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "tst: " << ex.what() << "\n";
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "tst: unknown error\n";
        return 3; // internal error
    }
}
