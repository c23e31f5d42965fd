#include "tst_engine/discovery.hpp"
#include "tst_engine/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <glob.h>

namespace fs = std::filesystem;

namespace {

bool is_glob_pattern(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> expand_glob(const std::string& pattern) {
    std::vector<std::string> matches;
    glob_t result{};
    const int rc = ::glob(pattern.c_str(), 0, nullptr, &result);
    if (rc == 0) {
        for (std::size_t i = 0; i < result.gl_pathc; ++i) {
            if (fs::is_regular_file(result.gl_pathv[i])) {
                matches.emplace_back(result.gl_pathv[i]);
            }
        }
    }
    globfree(&result);
    return matches;
}

}  // namespace

namespace tst::engine {

std::vector<std::string> resolve_subjects(const std::vector<std::string>& patterns,
                                          const fs::path& directory,
                                          const std::set<std::string>& extensions) {
    std::vector<std::string> subjects;

    if (patterns.empty()) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(directory, ec)) {
            const auto name = entry.path().filename().string();
            if (!entry.is_regular_file() || name.empty() || name.front() == '.') {
                continue;
            }
            if (extensions.count(entry.path().extension().string()) != 0) {
                subjects.push_back(name);
            }
        }
    }

    for (const auto& pattern : patterns) {
        if (is_glob_pattern(pattern)) {
            auto matches = expand_glob(pattern);
            subjects.insert(subjects.end(), matches.begin(), matches.end());
            continue;
        }
        if (!fs::exists(pattern)) {
            throw EnvironmentError("file not found: " + pattern);
        }
        subjects.push_back(pattern);
    }

    std::sort(subjects.begin(), subjects.end());
    subjects.erase(std::unique(subjects.begin(), subjects.end()), subjects.end());
    return subjects;
}

}  // namespace tst::engine
