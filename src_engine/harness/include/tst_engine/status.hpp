#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tst::engine {

/**
 * \brief Symbolic outcome of one run.
 *
 * The first block holds the engine's own outcomes; the second block holds the
 * runtime-error kinds recognised in a subject's stderr. Every status maps to
 * exactly one summary character (see summary_char()).
 */
enum class Status {
    Success,
    QuasiSuccess,
    AllTokensSequence,
    AllTokensMultiset,
    MissingTokens,
    Fail,
    ScriptTestError,
    Inconclusive,
    Timeout,
    DefaultError,

    AttributeError,
    EOFError,
    IndentationError,
    IndexError,
    KeyError,
    NameError,
    RecursionError,
    SyntaxError,
    TypeError,
    ValueError,
    ZeroDivisionError,
};

inline constexpr char kSuccessChar = '.';

[[nodiscard]] std::string_view to_string(Status status) noexcept;

[[nodiscard]] char summary_char(Status status) noexcept;

/// Runtime-error kinds, i.e. the statuses that can upgrade a DefaultError.
[[nodiscard]] const std::vector<Status>& runtime_error_kinds();

/**
 * \brief Picks the runtime-error kind named in a subject's stderr.
 *
 * The kind whose name occurs leftmost in \p stderr_text wins; when two names
 * start at the same offset the longer one wins. Returns nullopt when no kind
 * name occurs at all.
 */
[[nodiscard]] std::optional<Status> detect_runtime_error(std::string_view stderr_text);

}  // namespace tst::engine
