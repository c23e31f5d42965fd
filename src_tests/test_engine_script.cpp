/**
 * @file test_engine_script.cpp
 * @brief Tests for script test cases run through a verifier
 */

#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "tst_engine/engine.hpp"

#include <chrono>
#include <string>

using namespace tst::engine;
using namespace std::chrono_literals;

namespace {

class ScriptFixture {
protected:
    ScriptFixture() : subject_{dir_.write("sum.py", "print(5)\n").string()} {}

    RunResult verify(const std::string& body, std::chrono::milliseconds timeout = 5000ms) {
        const auto verifier = dir_.write("verify.sh", body);
        TestDefinition def;
        def.type = "script";
        def.script = "sh " + verifier.string();

        Engine::Config config;
        config.timeout = timeout;
        return Engine(config).run(TestCase(def), subject_);
    }

    tst_test::TempDir dir_;
    std::string subject_;
};

}  // namespace

TEST_CASE_METHOD(ScriptFixture, "a JSON report on stdout", "[engine][script]") {
    const auto result = verify("echo '{\"summary\": \"...\", \"feedback\": \"all good\"}'");
    REQUIRE(result.type == TestType::Script);
    REQUIRE(result.status == Status::Success);
    REQUIRE(result.summary == "...");
    REQUIRE(result.feedback == "all good");
}

TEST_CASE_METHOD(ScriptFixture, "a text report on stderr", "[engine][script]") {
    const auto result = verify("printf '..F\\n\\nline one\\nline two\\n' >&2");
    REQUIRE(result.status == Status::Fail);
    REQUIRE(result.summary == "..F");
    REQUIRE(result.feedback == "line one\nline two");
}

TEST_CASE_METHOD(ScriptFixture, "stderr is preferred over stdout", "[engine][script]") {
    const auto result = verify("echo .\necho F >&2");
    REQUIRE(result.summary == "F");
    REQUIRE(result.status == Status::Fail);
}

TEST_CASE_METHOD(ScriptFixture, "the verifier receives the subject name", "[engine][script]") {
    const auto result = verify("[ \"$1\" = \"" + subject_ + "\" ] && echo . || echo F");
    REQUIRE(result.status == Status::Success);
    REQUIRE(result.summary == ".");
}

TEST_CASE_METHOD(ScriptFixture, "a verifier exiting non-zero is a script error", "[engine][script]") {
    const auto result = verify("echo ...\nexit 2");
    REQUIRE(result.status == Status::ScriptTestError);
    REQUIRE(result.summary == "!");
    REQUIRE(result.exit_status == 2);
}

TEST_CASE_METHOD(ScriptFixture, "a verifier without a report is inconclusive", "[engine][script]") {
    const auto result = verify("echo 'this is not a report'");
    REQUIRE(result.status == Status::Inconclusive);
    REQUIRE(result.summary == "?");
}

TEST_CASE_METHOD(ScriptFixture, "a verifier past the timeout", "[engine][script]") {
    const auto result = verify("sleep 10", 300ms);
    REQUIRE(result.status == Status::Timeout);
    REQUIRE(result.summary == "t");
    REQUIRE(result.stdout_text.empty());
}

TEST_CASE("a missing verifier is a default error", "[engine][script]") {
    TestDefinition def;
    def.type = "script";
    def.script = "/nonexistent/verify";
    const auto result = Engine(Engine::Config{}).run(TestCase(def), "sum.py");
    REQUIRE(result.status == Status::DefaultError);
    REQUIRE(result.summary == "e");
}
