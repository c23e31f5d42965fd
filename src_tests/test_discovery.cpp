/**
 * @file test_discovery.cpp
 * @brief Unit tests for subject resolution
 */

#include <catch2/catch.hpp>

#include "test_support.hpp"
#include "tst_engine/discovery.hpp"
#include "tst_engine/errors.hpp"

#include <string>
#include <vector>

using namespace tst::engine;

TEST_CASE("without patterns the directory is scanned by extension", "[discovery]") {
    tst_test::TempDir dir;
    dir.write("b.sh", "");
    dir.write("a.py", "");
    dir.write("notes.txt", "");
    dir.write(".hidden.py", "");

    REQUIRE(resolve_subjects({}, dir.path(), {".py", ".sh"}) == std::vector<std::string>{"a.py", "b.sh"});
}

TEST_CASE("glob patterns expand to sorted matches", "[discovery]") {
    tst_test::TempDir dir;
    const auto b = dir.write("b.py", "").string();
    const auto a = dir.write("a.py", "").string();
    dir.write("c.sh", "");

    const auto pattern = (dir.path() / "*.py").string();
    REQUIRE(resolve_subjects({pattern}, dir.path(), {}) == std::vector<std::string>{a, b});
    REQUIRE(resolve_subjects({(dir.path() / "*.rb").string()}, dir.path(), {}).empty());
}

TEST_CASE("literal paths are de-duplicated", "[discovery]") {
    tst_test::TempDir dir;
    const auto a = dir.write("a.py", "").string();

    REQUIRE(resolve_subjects({a, (dir.path() / "*.py").string(), a}, dir.path(), {}) ==
            std::vector<std::string>{a});
}

TEST_CASE("a missing literal path is an environment error", "[discovery]") {
    tst_test::TempDir dir;
    REQUIRE_THROWS_AS(resolve_subjects({(dir.path() / "absent.py").string()}, dir.path(), {}),
                      EnvironmentError);
}
