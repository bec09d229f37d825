#include "path/GlobToRegex.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace {

using PK::Error;
using PK::Expected;

constexpr std::string_view kRegexMeta = ".^$|()[]{}*+?\\";
constexpr std::string_view kClassMeta = "\\]-[^";

// Bracket-expression tails for bytes outside ASCII, and for one multi-byte UTF-8 sequence.
constexpr std::string_view kNonAsciiBytes = "\\x80-\\xFF";
constexpr std::string_view kWideSequence  = "[\\xC0-\\xFF][\\x80-\\xBF]+";

auto pattern_error(std::string message, std::string_view glob) -> Error {
    return Error{Error::Code::InvalidPattern, std::move(message) + " in glob '" + std::string(glob) + "'"};
}

// Byte length of the UTF-8 sequence starting at glob[pos], clamped to the input.
auto sequence_width(std::string_view glob, std::size_t pos) -> std::size_t {
    auto const lead  = static_cast<unsigned char>(glob[pos]);
    std::size_t width = 1;
    if ((lead & 0xE0U) == 0xC0U) {
        width = 2;
    } else if ((lead & 0xF0U) == 0xE0U) {
        width = 3;
    } else if ((lead & 0xF8U) == 0xF0U) {
        width = 4;
    }
    return std::min(width, glob.size() - pos);
}

auto append_literal(std::string& regex, char ch) -> void {
    if (kRegexMeta.find(ch) != std::string_view::npos) {
        regex.push_back('\\');
    }
    regex.push_back(ch);
}

auto append_class_literal(std::string& body, char ch) -> void {
    if (kClassMeta.find(ch) != std::string_view::npos) {
        body.push_back('\\');
    }
    body.push_back(ch);
}

auto separator_class_body(std::string_view separators) -> std::string {
    std::string body;
    for (auto ch : separators) {
        append_class_literal(body, ch);
    }
    return body;
}

// One character that is not a separator: a single ASCII byte or a whole multi-byte sequence.
auto any_character(std::string_view separatorBody, std::string_view excluded = {}) -> std::string {
    std::string result{"(?:[^"};
    result.append(separatorBody).append(excluded).append(kNonAsciiBytes).append("]|").append(kWideSequence).append(")");
    return result;
}

auto join_alternatives(std::vector<std::string> const& alternatives) -> std::string {
    std::string joined;
    for (std::size_t idx = 0; idx < alternatives.size(); ++idx) {
        if (idx > 0) {
            joined.push_back('|');
        }
        joined.append(alternatives[idx]);
    }
    return joined;
}

// Consumes a character class starting at glob[pos] == '['. Returns the index of the closing ']'.
// ASCII members become a bracket expression; multi-byte members become alternatives.
auto translate_class(std::string_view glob, std::size_t pos, std::string_view separators, std::string_view separatorBody, std::string& regex)
        -> Expected<std::size_t> {
    std::size_t idx    = pos + 1;
    bool        negate = false;
    if (idx < glob.size() && (glob[idx] == '!' || glob[idx] == '^')) {
        negate = true;
        ++idx;
    }

    std::string              body;
    std::vector<std::string> wide;
    bool                     hasPrevious = false;
    unsigned char            previous    = 0;
    for (; idx < glob.size() && glob[idx] != ']'; ++idx) {
        if (glob[idx] == '\\') {
            if (idx + 1 >= glob.size()) {
                return std::unexpected(pattern_error("unterminated escape", glob));
            }
            ++idx;
        } else if (glob[idx] == '-' && hasPrevious && idx + 1 < glob.size() && glob[idx + 1] != ']') {
            auto endPos = idx + 1;
            if (glob[endPos] == '\\' && endPos + 1 < glob.size()) {
                ++endPos;
            }
            auto const rangeEnd = static_cast<unsigned char>(glob[endPos]);
            if (rangeEnd >= 0x80U) {
                return std::unexpected(pattern_error("non-ASCII character range", glob));
            }
            if (separators.find(static_cast<char>(rangeEnd)) != std::string_view::npos) {
                return std::unexpected(pattern_error("separator not allowed in character class", glob));
            }
            if (rangeEnd < previous) {
                return std::unexpected(pattern_error("invalid character range", glob));
            }
            body.push_back('-');
            append_class_literal(body, static_cast<char>(rangeEnd));
            hasPrevious = false;
            idx         = endPos;
            continue;
        }

        auto const width = sequence_width(glob, idx);
        if (width > 1) {
            auto const next = idx + width;
            if (next + 1 < glob.size() && glob[next] == '-' && glob[next + 1] != ']') {
                return std::unexpected(pattern_error("non-ASCII character range", glob));
            }
            wide.emplace_back(glob.substr(idx, width));
            hasPrevious = false;
            idx         = next - 1;
            continue;
        }

        char const ch = glob[idx];
        if (separators.find(ch) != std::string_view::npos) {
            return std::unexpected(pattern_error("separator not allowed in character class", glob));
        }
        append_class_literal(body, ch);
        previous    = static_cast<unsigned char>(ch);
        hasPrevious = true;
    }

    if (idx >= glob.size()) {
        return std::unexpected(pattern_error("unclosed character class", glob));
    }
    if (body.empty() && wide.empty()) {
        return std::unexpected(pattern_error("empty character class", glob));
    }

    if (negate) {
        if (!wide.empty()) {
            regex.append("(?!").append(join_alternatives(wide)).append(")");
        }
        regex.append(any_character(separatorBody, body));
    } else if (wide.empty()) {
        regex.append("[").append(body).append("]");
    } else {
        std::vector<std::string> alternatives;
        if (!body.empty()) {
            alternatives.push_back("[" + body + "]");
        }
        alternatives.insert(alternatives.end(), wide.begin(), wide.end());
        regex.append("(?:").append(join_alternatives(alternatives)).append(")");
    }
    return idx;
}

} // namespace

namespace PK {

auto globToRegex(std::string_view glob, std::string_view separators) -> Expected<std::string> {
    auto const separatorBody = separator_class_body(separators);
    auto const anyName       = "[^" + separatorBody + "]";
    auto const anyCharacter  = any_character(separatorBody);
    auto const anySeparator  = "[" + separatorBody + "]";

    std::string regex;
    regex.reserve(glob.size() * 2);
    bool inGroup = false;

    for (std::size_t idx = 0; idx < glob.size(); ++idx) {
        char const ch = glob[idx];
        switch (ch) {
        case '\\':
            if (idx + 1 >= glob.size()) {
                return std::unexpected(pattern_error("unterminated escape", glob));
            }
            append_literal(regex, glob[++idx]);
            break;
        case '*':
            // Continuation bytes are never separators, so a byte run stays within one name.
            if (idx + 1 < glob.size() && glob[idx + 1] == '*') {
                regex.append(".*");
                ++idx;
            } else {
                regex.append(anyName).append("*");
            }
            break;
        case '?':
            regex.append(anyCharacter);
            break;
        case '[': {
            auto closing = translate_class(glob, idx, separators, separatorBody, regex);
            if (!closing) {
                return std::unexpected(closing.error());
            }
            idx = *closing;
            break;
        }
        case '{':
            if (inGroup) {
                return std::unexpected(pattern_error("nested group", glob));
            }
            inGroup = true;
            regex.append("(?:");
            break;
        case '}':
            if (inGroup) {
                regex.push_back(')');
                inGroup = false;
            } else {
                append_literal(regex, ch);
            }
            break;
        case ',':
            if (inGroup) {
                regex.push_back('|');
            } else {
                append_literal(regex, ch);
            }
            break;
        default:
            if (separators.find(ch) != std::string_view::npos) {
                regex.append(anySeparator);
            } else {
                append_literal(regex, ch);
            }
            break;
        }
    }

    if (inGroup) {
        return std::unexpected(pattern_error("unclosed group", glob));
    }
    return regex;
}

} // namespace PK
