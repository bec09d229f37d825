#pragma once
#include "core/Error.hpp"
#include "name/Name.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace PK {

// Raw output of PathType::parse, before any normalization.
struct ParsedPath {
    std::optional<std::string> root;
    std::vector<std::string>   names;

    auto isEmpty() const noexcept -> bool { return !root && names.empty(); }
};

/**
 * Syntax policy for one family of path strings.
 *
 * Posix:   separator '/', the only root is "/".
 * Windows: separator '\', '/' accepted on input. Roots are "C:\" style drives
 *          and "\\host\share\" UNC prefixes.
 *
 * Empty segments (leading, trailing or repeated separators, empty input
 * strings) never become names.
 */
class PathType {
public:
    struct Posix {};
    struct Windows {};
    using Syntax = std::variant<Posix, Windows>;

    static auto posix() -> PathType;
    static auto windows() -> PathType;

    auto syntax() const noexcept -> Syntax const& { return syntax_; }
    auto isPosix() const noexcept -> bool { return std::holds_alternative<Posix>(syntax_); }
    auto isWindows() const noexcept -> bool { return std::holds_alternative<Windows>(syntax_); }

    auto name() const noexcept -> std::string_view;
    auto separator() const noexcept -> std::string_view;
    // Characters accepted as separators on input in addition to separator().
    auto otherSeparators() const noexcept -> std::string_view;

    // Joins the non-empty parts with the separator, then splits into root and names.
    auto parse(std::span<std::string_view const> parts) const -> Expected<ParsedPath>;
    auto parse(std::string_view path) const -> Expected<ParsedPath>;

    auto render(Name const* root, std::span<Name const> names) const -> std::string;

private:
    explicit PathType(Syntax syntax);

    Syntax syntax_;
};

} // namespace PK
