#pragma once
#include "core/Error.hpp"
#include "path/PathType.hpp"

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>

namespace PK {

/**
 * Compiled "glob:" or "regex:" predicate over rendered path text. Matching is
 * a full match against the whole string and does not mutate the matcher.
 */
class PathMatcher {
public:
    // std::regex matching recurses per input character; longer text never matches.
    static constexpr std::size_t kMaxMatchLength = 4096;

    enum class Syntax {
        Glob,
        Regex
    };

    // caseInsensitive compiles the expression with std::regex::icase.
    static auto compile(std::string_view syntaxAndPattern, PathType const& type, bool caseInsensitive = false)
            -> Expected<PathMatcher>;

    // False for text longer than kMaxMatchLength.
    auto matches(std::string_view path) const -> bool;

    auto syntax() const noexcept -> Syntax { return syntax_; }
    auto pattern() const noexcept -> std::string const& { return pattern_; }
    auto regexPattern() const noexcept -> std::string const& { return regexPattern_; }

private:
    PathMatcher(Syntax syntax, std::string pattern, std::string regexPattern, std::regex regex);

    Syntax      syntax_;
    std::string pattern_;
    std::string regexPattern_;
    std::regex  regex_;
};

} // namespace PK
