#include "tst_engine/status.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace {

using tst::engine::Status;

struct StatusEntry {
    Status status;
    std::string_view name;
    char code;
};

constexpr std::array<StatusEntry, 21> kStatusTable{{
    {Status::Success, "Success", '.'},
    {Status::QuasiSuccess, "QuasiSuccess", '*'},
    {Status::AllTokensSequence, "AllTokensSequence", '@'},
    {Status::AllTokensMultiset, "AllTokensMultiset", '&'},
    {Status::MissingTokens, "MissingTokens", '%'},
    {Status::Fail, "Fail", 'F'},
    {Status::ScriptTestError, "ScriptTestError", '!'},
    {Status::Inconclusive, "Inconclusive", '?'},
    {Status::Timeout, "Timeout", 't'},
    {Status::DefaultError, "DefaultError", 'e'},

    {Status::AttributeError, "AttributeError", 'a'},
    {Status::EOFError, "EOFError", 'o'},
    {Status::IndentationError, "IndentationError", 'i'},
    {Status::IndexError, "IndexError", 'x'},
    {Status::KeyError, "KeyError", 'k'},
    {Status::NameError, "NameError", 'n'},
    {Status::RecursionError, "RecursionError", 'r'},
    {Status::SyntaxError, "SyntaxError", 's'},
    {Status::TypeError, "TypeError", 'y'},
    {Status::ValueError, "ValueError", 'v'},
    {Status::ZeroDivisionError, "ZeroDivisionError", 'z'},
}};

// Index of the first runtime-error kind in kStatusTable.
constexpr std::size_t kFirstRuntimeKind = 10;

const StatusEntry& entry_of(Status status) noexcept {
    return kStatusTable[static_cast<std::size_t>(status)];
}

}  // namespace

namespace tst::engine {

std::string_view to_string(Status status) noexcept {
    return entry_of(status).name;
}

char summary_char(Status status) noexcept {
    return entry_of(status).code;
}

const std::vector<Status>& runtime_error_kinds() {
    static const std::vector<Status> kinds = [] {
        std::vector<Status> result;
        for (std::size_t i = kFirstRuntimeKind; i < kStatusTable.size(); ++i) {
            result.push_back(kStatusTable[i].status);
        }
        return result;
    }();
    return kinds;
}

std::optional<Status> detect_runtime_error(std::string_view stderr_text) {
    std::optional<Status> best;
    std::size_t best_pos = std::string_view::npos;
    std::size_t best_len = 0;

    for (const auto kind : runtime_error_kinds()) {
        const auto& entry = entry_of(kind);
        const auto pos = stderr_text.find(entry.name);
        if (pos == std::string_view::npos) {
            continue;
        }
        if (pos < best_pos || (pos == best_pos && entry.name.size() > best_len)) {
            best = entry.status;
            best_pos = pos;
            best_len = entry.name.size();
        }
    }
    return best;
}

}  // namespace tst::engine
