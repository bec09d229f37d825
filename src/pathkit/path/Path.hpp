#pragma once
#include "core/Error.hpp"
#include "name/Name.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PK {

class FileSystem;
class PathService;

/**
 * Immutable structured path: an optional root and an ordered list of names.
 *
 * Paths are created by a PathService and keep a pointer to it; the service must
 * outlive every path it produced. Equality, hashing, ordering and rendering all
 * delegate to the service, so two structurally identical paths produced by
 * services with different equality modes are not interchangeable.
 *
 * The empty path is a relative path with a single empty name, never a path
 * without names.
 */
class Path {
public:
    auto pathService() const noexcept -> PathService const& { return *service_; }
    // Owner of the producing service, nullptr until the service is bound.
    auto fileSystem() const noexcept -> FileSystem const*;

    auto isAbsolute() const noexcept -> bool { return root_.has_value(); }
    auto isEmptyPath() const noexcept -> bool;
    auto rootComponent() const noexcept -> std::optional<Name> const& { return root_; }
    auto nameCount() const noexcept -> std::size_t { return names_.size(); }
    auto nameAt(std::size_t index) const -> Expected<Name>;
    auto names() const noexcept -> std::span<Name const> { return names_; }

    auto root() const -> std::optional<Path>;
    auto fileName() const -> std::optional<Path>;
    auto parent() const -> std::optional<Path>;
    auto subpath(std::size_t beginIndex, std::size_t endIndex) const -> Expected<Path>;

    auto startsWith(Path const& other) const -> bool;
    auto endsWith(Path const& other) const -> bool;

    auto resolve(Path const& other) const -> Path;
    auto resolve(std::string_view other) const -> Expected<Path>;
    auto resolveSibling(Path const& other) const -> Path;
    // Lexical only: drops "." and folds "name/..". Never consults a file tree.
    auto normalize() const -> Path;
    auto relativize(Path const& other) const -> Expected<Path>;

    auto toString() const -> std::string;
    auto hash() const -> std::size_t;
    auto compareTo(Path const& other) const -> int;

    auto operator==(Path const& other) const -> bool;
    // Paths of different services order by service address, consistent with ==.
    auto operator<=>(Path const& other) const -> std::strong_ordering;

private:
    friend class PathService;

    Path(PathService const& service, std::optional<Name> root, std::vector<Name> names);

    auto sameName(Name const& lhs, Name const& rhs) const -> bool;

    PathService const*  service_;
    std::optional<Name> root_;
    std::vector<Name>   names_;
};

} // namespace PK

namespace std {

template <>
struct hash<PK::Path> {
    std::size_t operator()(const PK::Path& path) const {
        return path.hash();
    }
};

} // namespace std
