#include "tst_engine/subject.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace tst::engine {

std::string_view to_string(Verdict verdict) noexcept {
    return verdict == Verdict::Success ? "success" : "fail";
}

TestSubject::TestSubject(std::string filename) : filename_{std::move(filename)} {}

void TestSubject::add_run(RunResult run) {
    runs_.push_back(std::move(run));
    flat_summaries_.reset();
    joined_summaries_.reset();
}

const std::vector<std::string>& TestSubject::summaries(bool join_io) const {
    if (join_io) {
        if (!joined_summaries_) {
            std::string io;
            std::vector<std::string> others;
            for (const auto& run : runs_) {
                if (run.type == TestType::Io) {
                    io += run.summary;
                } else {
                    others.push_back(run.summary);
                }
            }
            std::vector<std::string> joined;
            if (!io.empty()) {
                joined.push_back(std::move(io));
            }
            joined.insert(joined.end(), std::make_move_iterator(others.begin()),
                          std::make_move_iterator(others.end()));
            joined_summaries_ = std::move(joined);
        }
        return *joined_summaries_;
    }

    if (!flat_summaries_) {
        std::vector<std::string> flat;
        for (const auto& run : runs_) {
            for (const char ch : run.summary) {
                flat.emplace_back(1, ch);
            }
        }
        flat_summaries_ = std::move(flat);
    }
    return *flat_summaries_;
}

std::string TestSubject::summary() const {
    std::string result;
    for (const auto& run : runs_) {
        result += run.summary;
    }
    return result;
}

Verdict TestSubject::verdict() const {
    const auto& chars = summaries();
    const bool passed = std::all_of(chars.begin(), chars.end(),
                                    [](const std::string& s) { return s.size() == 1 && s[0] == kSuccessChar; });
    return passed ? Verdict::Success : Verdict::Fail;
}

}  // namespace tst::engine
