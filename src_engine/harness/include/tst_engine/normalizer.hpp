#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tst::engine {

/**
 * \brief Named text transforms used to make comparisons insensitive to noise.
 *
 * Enumerators are declared in lexicographic order of their names. An
 * OperatorSet iterates in enumerator order, so applying a set always runs the
 * operators sorted by name: `whites` runs last, after `extra_whites`.
 */
enum class Operator {
    Accents,
    Case,
    ExtraWhites,
    Linebreaks,
    Punctuation,
    Whites,
};

using OperatorSet = std::set<Operator>;

[[nodiscard]] std::string_view to_string(Operator op) noexcept;

[[nodiscard]] std::optional<Operator> operator_from_name(std::string_view name) noexcept;

/// `case`, `accents`, `extra_whites`.
[[nodiscard]] const OperatorSet& default_operators();

[[nodiscard]] const OperatorSet& all_operators();

/**
 * \brief Resolves operator names; the sentinel `all` selects every operator.
 *
 * Throws std::invalid_argument on an unknown name.
 */
[[nodiscard]] OperatorSet parse_operators(const std::vector<std::string>& names);

[[nodiscard]] std::vector<std::string> operator_names(const OperatorSet& ops);

/// Applies a single operator.
[[nodiscard]] std::string apply(Operator op, std::string_view text);

/// Applies every operator of \p ops in name order. An empty set is the identity.
[[nodiscard]] std::string preprocess(std::string_view text, const OperatorSet& ops);

/// Name-based entry point; see parse_operators().
[[nodiscard]] std::string preprocess(std::string_view text, const std::vector<std::string>& names);

}  // namespace tst::engine
