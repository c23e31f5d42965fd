/**
 * @file test_report_writer.cpp
 * @brief Unit tests for the report encodings
 */

#include <catch2/catch.hpp>

#include "tst_engine/report_writer.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace tst::engine;

namespace {

RunResult io_run(Status status, std::string observed) {
    RunResult run;
    run.type = TestType::Io;
    run.name = "#1";
    run.status = status;
    run.summary = std::string(1, summary_char(status));
    run.input = "2\n3\n";
    run.output = "5\n";
    run.stdout_text = std::move(observed);
    run.exit_status = 0;
    return run;
}

RunResult script_run(std::string summary) {
    RunResult run;
    run.type = TestType::Script;
    run.name = "style";
    run.index = 1;
    run.status = summary == "..." ? Status::Success : Status::Fail;
    run.summary = std::move(summary);
    run.script = "sh style.sh";
    run.feedback = "line too long";
    run.exit_status = 0;
    return run;
}

std::vector<TestSubject> sample_subjects() {
    TestSubject good("good.py");
    good.add_run(io_run(Status::Success, "5\n"));
    good.add_run(script_run("..."));

    TestSubject bad("bad.py");
    bad.add_run(io_run(Status::Fail, "The sum is 5\n"));
    bad.add_run(script_run("..F"));

    return {good, bad};
}

}  // namespace

TEST_CASE("report formats resolve by name", "[report]") {
    REQUIRE(report_format_from_name("raw") == ReportFormat::Raw);
    REQUIRE(report_format_from_name("json") == ReportFormat::Json);
    REQUIRE(report_format_from_name("html") == std::nullopt);
}

TEST_CASE("raw lines carry the joined summaries", "[report]") {
    const auto subjects = sample_subjects();
    REQUIRE(render_raw_line(subjects[0]) == "good.py . ...");
    REQUIRE(render_raw_line(subjects[1]) == "bad.py F ..F");
}

TEST_CASE("summary lines carry the verdict", "[report]") {
    const auto subjects = sample_subjects();
    REQUIRE(render_summary_line(subjects[0]) == "good.py success");
    REQUIRE(render_summary_line(subjects[1]) == "bad.py fail");
}

TEST_CASE("streaming formats write per subject only", "[report]") {
    const auto subjects = sample_subjects();
    const ReportWriter writer(ReportFormat::Summary);

    std::ostringstream out;
    for (const auto& subject : subjects) {
        writer.write_subject(out, subject);
    }
    writer.write_final(out, subjects);
    REQUIRE(out.str() == "good.py success\nbad.py fail\n");
}

TEST_CASE("json report lists every subject and run", "[report]") {
    const auto subjects = sample_subjects();
    const ReportWriter writer(ReportFormat::Json);

    std::ostringstream out;
    for (const auto& subject : subjects) {
        writer.write_subject(out, subject);
    }
    writer.write_final(out, subjects);

    const auto doc = nlohmann::json::parse(out.str());
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 2);
    REQUIRE(doc[1]["filename"] == "bad.py");
    REQUIRE(doc[1]["verdict"] == "fail");
    REQUIRE(doc[1]["summary"] == "F..F");
    REQUIRE(doc[1]["results"].size() == 2);
    REQUIRE(doc[1]["results"][0]["type"] == "io");
    REQUIRE(doc[1]["results"][0]["status"] == "Fail");
    REQUIRE(doc[1]["results"][0]["output"] == "5\n");
    REQUIRE(doc[1]["results"][1]["script"] == "sh style.sh");
    REQUIRE(doc[1]["results"][1]["feedback"] == "line too long");
}

TEST_CASE("json report survives output that is not UTF-8", "[report]") {
    TestSubject binary("binary.py");
    auto run = io_run(Status::Fail, "\xff\xfe bad\n");
    run.stderr_text = "\xc3";
    binary.add_run(run);

    auto subjects = sample_subjects();
    subjects.push_back(binary);

    std::ostringstream out;
    REQUIRE_NOTHROW(ReportWriter(ReportFormat::Json).write_final(out, subjects));

    const auto doc = nlohmann::json::parse(out.str());
    REQUIRE(doc.size() == 3);
    REQUIRE(doc[2]["filename"] == "binary.py");
    const auto observed = doc[2]["results"][0]["stdout"].get<std::string>();
    REQUIRE(observed == "\xef\xbf\xbd\xef\xbf\xbd bad\n");
    REQUIRE(doc[2]["results"][0]["stderr"] == "\xef\xbf\xbd");
}

TEST_CASE("debug report shows failing subjects and runs only", "[report]") {
    const auto text = render_debug(sample_subjects());
    REQUIRE(text.find("good.py") == std::string::npos);
    REQUIRE(text.find("== bad.py F..F") != std::string::npos);
    REQUIRE(text.find("- 5") != std::string::npos);
    REQUIRE(text.find("+ The sum is 5") != std::string::npos);
    REQUIRE(text.find("line too long") != std::string::npos);
}

TEST_CASE("line diff keeps common lines", "[report]") {
    REQUIRE(line_diff("a\nb\nc", "a\nx\nc") == std::vector<std::string>{"  a", "- b", "+ x", "  c"});
    REQUIRE(line_diff("", "x\n") == std::vector<std::string>{"+ x"});
    REQUIRE(line_diff("same\n", "same\n") == std::vector<std::string>{"  same"});
}
