#pragma once
#include "core/Error.hpp"

#include <string>
#include <string_view>

namespace PK {

/**
 * Translates a glob into an ECMAScript regular expression over rendered path
 * text. `separators` lists every character that separates names; the first
 * one is the canonical separator.
 *
 *   *        any run of characters within one name
 *   **       any run of characters, crossing separators
 *   ?        one character that is not a separator
 *   [a-z]    character class, [!a-z] or [^a-z] negated; never matches a separator
 *   {a,b}    alternation, not nestable
 *   \x       literal x
 *
 * A separator character in the glob matches any of the separators.
 */
[[nodiscard]] auto globToRegex(std::string_view glob, std::string_view separators) -> Expected<std::string>;

} // namespace PK
