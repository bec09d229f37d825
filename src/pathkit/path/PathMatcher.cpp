#include "path/PathMatcher.hpp"

#include "log/TaggedLogger.hpp"
#include "path/GlobToRegex.hpp"

#include <string>
#include <utility>

namespace PK {

PathMatcher::PathMatcher(Syntax syntax, std::string pattern, std::string regexPattern, std::regex regex)
    : syntax_(syntax), pattern_(std::move(pattern)), regexPattern_(std::move(regexPattern)), regex_(std::move(regex)) {}

auto PathMatcher::compile(std::string_view syntaxAndPattern, PathType const& type, bool caseInsensitive) -> Expected<PathMatcher> {
    auto const colon = syntaxAndPattern.find(':');
    if (colon == std::string_view::npos) {
        return std::unexpected(Error{Error::Code::UnsupportedSyntax,
                                     "missing syntax prefix in '" + std::string(syntaxAndPattern) + "'"});
    }

    auto const scheme  = syntaxAndPattern.substr(0, colon);
    auto const pattern = syntaxAndPattern.substr(colon + 1);

    Syntax      syntax;
    std::string regexPattern;
    if (scheme == "glob") {
        std::string separators{type.separator()};
        separators.append(type.otherSeparators());
        auto translated = globToRegex(pattern, separators);
        if (!translated) {
            return std::unexpected(translated.error());
        }
        syntax       = Syntax::Glob;
        regexPattern = std::move(*translated);
    } else if (scheme == "regex") {
        syntax       = Syntax::Regex;
        regexPattern = std::string{pattern};
    } else {
        return std::unexpected(Error{Error::Code::UnsupportedSyntax,
                                     "syntax '" + std::string(scheme) + "' is not recognized"});
    }

    auto flags = std::regex::ECMAScript;
    if (caseInsensitive) {
        flags |= std::regex::icase;
    }

    try {
        std::regex regex{regexPattern, flags};
        pk_log("Compiled " + std::string(syntaxAndPattern) + " as /" + regexPattern + "/", "PathMatcher");
        return PathMatcher{syntax, std::string{pattern}, std::move(regexPattern), std::move(regex)};
    } catch (std::regex_error const& error) {
        return std::unexpected(Error{Error::Code::InvalidPattern,
                                     "cannot compile '" + std::string(pattern) + "': " + error.what()});
    }
}

auto PathMatcher::matches(std::string_view path) const -> bool {
    if (path.size() > kMaxMatchLength) {
        pk_log("Not matching " + std::to_string(path.size()) + " bytes against '" + pattern_ + "': longer than "
                       + std::to_string(kMaxMatchLength),
               "PathMatcher");
        return false;
    }
    return std::regex_match(path.begin(), path.end(), regex_);
}

} // namespace PK
