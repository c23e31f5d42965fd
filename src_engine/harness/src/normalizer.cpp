#include "tst_engine/normalizer.hpp"

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using tst::engine::Operator;
using tst::engine::OperatorSet;

constexpr std::array<std::string_view, 6> kOperatorNames{
    "accents", "case", "extra_whites", "linebreaks", "punctuation", "whites",
};

constexpr std::string_view kAllSentinel = "all";
constexpr std::string_view kAsciiPunctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
constexpr std::string_view kAsciiWhitespace = " \t\n\r\f\v";

// Base letters for U+00C0..U+00FF and U+0100..U+017F; '-' marks characters
// without a canonical decomposition.
constexpr std::string_view kLatin1Bases =
    "AAAAAA-CEEEEIIII"
    "-NOOOOO--UUUUY--"
    "aaaaaa-ceeeeiiii"
    "-nooooo--uuuuy-y";
constexpr std::string_view kLatinExtABases =
    "AaAaAaCcCcCcCcDd"
    "--EeEeEeEeEeGgGg"
    "GgGgHh--IiIiIiIi"
    "I---JjKk-LlLlLl-"
    "---NnNnNn---OoOo"
    "Oo--RrRrRrSsSsSs"
    "SsTtTt--UuUuUuUu"
    "UuUuWwYyYZzZzZz-";

struct Decoded {
    char32_t cp;
    std::size_t length;
    bool valid;
};

// Lenient UTF-8 decoder: an invalid sequence yields a single raw byte.
Decoded decode_at(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        return {lead, 1, true};
    }
    std::size_t length = 0;
    char32_t cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        return {lead, 1, false};
    }
    if (pos + length > text.size()) {
        return {lead, 1, false};
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto cont = static_cast<unsigned char>(text[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return {lead, 1, false};
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    return {cp, length, true};
}

void encode(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Runs `fn(cp)` over every decoded code point; fn returns the replacement
// code point or U+0000 to drop it. Invalid bytes are copied through.
template <typename Fn>
std::string map_code_points(std::string_view text, Fn fn) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto d = decode_at(text, pos);
        if (!d.valid) {
            out.push_back(text[pos]);
        } else if (const char32_t mapped = fn(d.cp); mapped != 0 || d.cp == 0) {
            encode(mapped, out);
        }
        pos += d.length;
    }
    return out;
}

char32_t fold_case(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    if (cp <= 0xDE) return cp == 0xD7 ? cp : cp + 0x20;
    if (cp >= 0x0100 && cp <= 0x017F) {
        if (cp == 0x0130) return U'i';
        if (cp == 0x0178) return 0x00FF;
        const bool odd_upper = (cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E);
        const bool even_upper = (cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) ||
                                (cp >= 0x014A && cp <= 0x0177);
        if (odd_upper && (cp & 1) == 1) return cp + 1;
        if (even_upper && (cp & 1) == 0) return cp + 1;
        return cp;
    }
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    return cp;
}

char32_t strip_accent(char32_t cp) {
    if (cp >= 0x0300 && cp <= 0x036F) return 0;  // combining diacritical marks
    if (cp >= 0xC0 && cp <= 0xFF) {
        const char base = kLatin1Bases[cp - 0xC0];
        return base == '-' ? cp : static_cast<char32_t>(base);
    }
    if (cp >= 0x0100 && cp <= 0x017F) {
        const char base = kLatinExtABases[cp - 0x0100];
        return base == '-' ? cp : static_cast<char32_t>(base);
    }
    return cp;
}

bool is_punctuation(char32_t cp) {
    if (cp < 0x80) return kAsciiPunctuation.find(static_cast<char>(cp)) != std::string_view::npos;
    switch (cp) {
        case 0x00A1: case 0x00AB: case 0x00B7: case 0x00BB: case 0x00BF:
            return true;
        default:
            return cp >= 0x2010 && cp <= 0x2027;
    }
}

bool is_white(char ch) {
    return kAsciiWhitespace.find(ch) != std::string_view::npos;
}

// Splits on \n, \r\n and \r. A trailing line break does not open an extra line.
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char ch = text[pos];
        if (ch == '\n' || ch == '\r') {
            lines.push_back(text.substr(start, pos - start));
            if (ch == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
                ++pos;
            }
            start = pos + 1;
        }
        ++pos;
    }
    if (start < text.size()) {
        lines.push_back(text.substr(start));
    }
    return lines;
}

std::string squeeze_line(std::string_view line) {
    std::string out;
    bool pending_space = false;
    for (const char ch : line) {
        if (is_white(ch)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(ch);
    }
    return out;
}

std::string squeeze_whites(std::string_view text) {
    auto lines = split_lines(text);
    std::vector<std::string> squeezed;
    squeezed.reserve(lines.size());
    for (const auto line : lines) {
        squeezed.push_back(squeeze_line(line));
    }
    while (!squeezed.empty() && squeezed.back().empty()) {
        squeezed.pop_back();
    }
    std::string out;
    for (std::size_t i = 0; i < squeezed.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += squeezed[i];
    }
    return out;
}

std::string join_lines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        out.push_back(ch == '\n' || ch == '\r' ? ' ' : ch);
    }
    return out;
}

std::string remove_whites(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        if (!is_white(ch)) out.push_back(ch);
    }
    return out;
}

}  // namespace

namespace tst::engine {

std::string_view to_string(Operator op) noexcept {
    return kOperatorNames[static_cast<std::size_t>(op)];
}

std::optional<Operator> operator_from_name(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kOperatorNames.size(); ++i) {
        if (kOperatorNames[i] == name) {
            return static_cast<Operator>(i);
        }
    }
    return std::nullopt;
}

const OperatorSet& default_operators() {
    static const OperatorSet ops{Operator::Case, Operator::Accents, Operator::ExtraWhites};
    return ops;
}

const OperatorSet& all_operators() {
    static const OperatorSet ops{Operator::Accents, Operator::Case, Operator::ExtraWhites,
                                 Operator::Linebreaks, Operator::Punctuation, Operator::Whites};
    return ops;
}

OperatorSet parse_operators(const std::vector<std::string>& names) {
    OperatorSet ops;
    for (const auto& name : names) {
        if (name == kAllSentinel) {
            return all_operators();
        }
        const auto op = operator_from_name(name);
        if (!op) {
            throw std::invalid_argument("unknown normalizer '" + name + "'");
        }
        ops.insert(*op);
    }
    return ops;
}

std::vector<std::string> operator_names(const OperatorSet& ops) {
    std::vector<std::string> names;
    names.reserve(ops.size());
    for (const auto op : ops) {
        names.emplace_back(to_string(op));
    }
    return names;
}

std::string apply(Operator op, std::string_view text) {
    switch (op) {
        case Operator::Accents:
            return map_code_points(text, strip_accent);
        case Operator::Case:
            return map_code_points(text, fold_case);
        case Operator::ExtraWhites:
            return squeeze_whites(text);
        case Operator::Linebreaks:
            return join_lines(text);
        case Operator::Punctuation:
            return map_code_points(text, [](char32_t cp) { return is_punctuation(cp) ? U' ' : cp; });
        case Operator::Whites:
            return remove_whites(text);
    }
    return std::string{text};
}

std::string preprocess(std::string_view text, const OperatorSet& ops) {
    std::string result{text};
    for (const auto op : ops) {
        result = apply(op, result);
    }
    return result;
}

std::string preprocess(std::string_view text, const std::vector<std::string>& names) {
    return preprocess(text, parse_operators(names));
}

}  // namespace tst::engine
