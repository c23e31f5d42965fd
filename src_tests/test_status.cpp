/**
 * @file test_status.cpp
 * @brief Unit tests for run statuses and runtime-error detection
 */

#include <catch2/catch.hpp>

#include "tst_engine/status.hpp"

using namespace tst::engine;

TEST_CASE("engine statuses map to their summary characters", "[status]") {
    REQUIRE(summary_char(Status::Success) == '.');
    REQUIRE(summary_char(Status::QuasiSuccess) == '*');
    REQUIRE(summary_char(Status::AllTokensSequence) == '@');
    REQUIRE(summary_char(Status::AllTokensMultiset) == '&');
    REQUIRE(summary_char(Status::MissingTokens) == '%');
    REQUIRE(summary_char(Status::Fail) == 'F');
    REQUIRE(summary_char(Status::ScriptTestError) == '!');
    REQUIRE(summary_char(Status::Inconclusive) == '?');
    REQUIRE(summary_char(Status::Timeout) == 't');
    REQUIRE(summary_char(Status::DefaultError) == 'e');
}

TEST_CASE("runtime-error kinds map to their summary characters", "[status]") {
    REQUIRE(summary_char(Status::AttributeError) == 'a');
    REQUIRE(summary_char(Status::EOFError) == 'o');
    REQUIRE(summary_char(Status::IndentationError) == 'i');
    REQUIRE(summary_char(Status::IndexError) == 'x');
    REQUIRE(summary_char(Status::KeyError) == 'k');
    REQUIRE(summary_char(Status::NameError) == 'n');
    REQUIRE(summary_char(Status::RecursionError) == 'r');
    REQUIRE(summary_char(Status::SyntaxError) == 's');
    REQUIRE(summary_char(Status::TypeError) == 'y');
    REQUIRE(summary_char(Status::ValueError) == 'v');
    REQUIRE(summary_char(Status::ZeroDivisionError) == 'z');
    REQUIRE(runtime_error_kinds().size() == 11);
}

TEST_CASE("statuses are named after their enumerators", "[status]") {
    REQUIRE(to_string(Status::ZeroDivisionError) == "ZeroDivisionError");
    REQUIRE(to_string(Status::AllTokensSequence) == "AllTokensSequence");
}

TEST_CASE("a runtime error is detected from the traceback", "[status]") {
    const auto stderr_text =
        "Traceback (most recent call last):\n"
        "  File \"sum.py\", line 3, in <module>\n"
        "ZeroDivisionError: division by zero\n";
    REQUIRE(detect_runtime_error(stderr_text) == Status::ZeroDivisionError);
}

TEST_CASE("the leftmost runtime-error name wins", "[status]") {
    REQUIRE(detect_runtime_error("NameError raised while handling TypeError") == Status::NameError);
    REQUIRE(detect_runtime_error("TypeError raised while handling NameError") == Status::TypeError);
}

TEST_CASE("stderr without a known kind yields nothing", "[status]") {
    REQUIRE_FALSE(detect_runtime_error("").has_value());
    REQUIRE_FALSE(detect_runtime_error("Segmentation fault (core dumped)").has_value());
    REQUIRE_FALSE(detect_runtime_error("Fail").has_value());
}
