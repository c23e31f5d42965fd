#pragma once

#include "test_definition.hpp"

#include <filesystem>
#include <optional>

namespace tst::engine {

/**
 * \brief Loads declarative test documents from disk.
 *
 * JSON (`.json`) and YAML (`.yaml`, `.yml`) documents are understood. A
 * document is either a sequence of test objects or a mapping with a `tests`
 * sequence and an optional document-level `ignore`:
 *
 * \code{.yaml}
 * ignore: [case, extra_whites]
 * tests:
 *   - name: sum
 *     input: "2\n3\n"
 *     output: "The sum is {{5}}"
 *   - type: script
 *     script: ./check_style.sh
 * \endcode
 *
 * Per test: `name`, `type` (`io` or `script`, default `io`), `input`,
 * `output`, `tokens`, `ignore`, `script`, `files`. `tokens`, `ignore` and
 * `files` accept either a single string (split on whitespace) or a sequence.
 * The document-level `ignore` is copied onto every test that has none.
 * Entries listed in `files` are resolved against the document directory and
 * must exist.
 */
class TestLoader {
public:
    TestLoader() = default;

    /// Throws EnvironmentError when the file is missing, TestDefinitionError when malformed.
    [[nodiscard]] TestDocument load(const std::filesystem::path& file) const;

    /// First existing of `tst.yaml`, `tst.yml`, `tst.json` in \p directory.
    [[nodiscard]] std::optional<std::filesystem::path> discover(const std::filesystem::path& directory) const;
};

}  // namespace tst::engine
