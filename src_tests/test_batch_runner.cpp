/**
 * @file test_batch_runner.cpp
 * @brief Tests for parallel execution and in-order publication of subjects
 */

#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "tst_engine/batch_runner.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace tst::engine;
using namespace std::chrono_literals;

namespace {

// Echoes its input line; the "slow" line finishes last.
constexpr auto kEchoSubject = "read x\n[ \"$x\" = slow ] && sleep 0.3\necho \"$x\"";

std::vector<TestCase> echo_tests() {
    std::vector<TestCase> tests;
    const std::vector<std::string> lines{"slow", "one", "two", "three"};
    for (std::size_t i = 0; i < lines.size(); ++i) {
        TestDefinition def;
        def.input = lines[i] + "\n";
        def.output = lines[i] + "\n";
        tests.emplace_back(def, i);
    }
    return tests;
}

Engine make_engine() {
    Engine::Config config;
    config.timeout = 5000ms;
    return Engine(config);
}

}  // namespace

TEST_CASE("runs are re-sequenced and subjects published in order", "[batch]") {
    tst_test::TempDir dir;
    std::vector<std::string> subjects;
    for (const auto* name : {"a.sh", "b.sh", "c.sh"}) {
        subjects.push_back(dir.write(name, kEchoSubject).string());
    }
    const auto tests = echo_tests();
    const auto engine = make_engine();

    for (const std::size_t jobs : {std::size_t{1}, std::size_t{4}}) {
        std::vector<std::string> published;
        const auto results = BatchRunner(engine, {jobs}).run(
            subjects, tests, [&](const TestSubject& subject) { published.push_back(subject.filename()); });

        REQUIRE(published == subjects);
        REQUIRE(results.size() == subjects.size());
        for (const auto& subject : results) {
            REQUIRE(subject.runs().size() == tests.size());
            for (std::size_t i = 0; i < tests.size(); ++i) {
                REQUIRE(subject.runs()[i].index == i);
                REQUIRE(subject.runs()[i].status == Status::Success);
            }
            REQUIRE(subject.summary() == "....");
            REQUIRE(subject.verdict() == Verdict::Success);
        }
    }
}

TEST_CASE("one failing subject does not stop the batch", "[batch]") {
    tst_test::TempDir dir;
    const std::vector<std::string> subjects{
        dir.write("good.sh", kEchoSubject).string(),
        dir.write("bad.sh", "exit 1").string(),
        "/nonexistent/tst-subject",
    };
    const auto tests = echo_tests();
    const auto engine = make_engine();

    const auto results = BatchRunner(engine, {3}).run(subjects, tests);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].verdict() == Verdict::Success);
    REQUIRE(results[1].summary() == "eeee");
    REQUIRE(results[2].summary() == "eeee");
}

TEST_CASE("subjects without tests are still published", "[batch]") {
    const auto engine = make_engine();
    std::size_t published = 0;
    const auto results = BatchRunner(engine, {2}).run({"a.py", "b.py"}, {},
                                                      [&](const TestSubject&) { ++published; });
    REQUIRE(published == 2);
    REQUIRE(results[0].runs().empty());
    REQUIRE(results[1].filename() == "b.py");
}
