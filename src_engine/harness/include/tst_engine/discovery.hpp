#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace tst::engine {

/**
 * \brief Turns the positional arguments into a sorted, de-duplicated subject list.
 *
 * Each pattern is a literal path or a glob(3) pattern. A literal path that
 * does not exist raises EnvironmentError; a glob matching nothing contributes
 * nothing. With no patterns, every non-hidden regular file of \p directory
 * whose extension is in \p extensions is a subject.
 */
[[nodiscard]] std::vector<std::string> resolve_subjects(const std::vector<std::string>& patterns,
                                                        const std::filesystem::path& directory,
                                                        const std::set<std::string>& extensions);

}  // namespace tst::engine
