#pragma once
#include "core/Error.hpp"
#include "core/FileSystem.hpp"
#include "name/Name.hpp"
#include "name/Normalization.hpp"
#include "path/Path.hpp"
#include "path/PathMatcher.hpp"
#include "path/PathType.hpp"
#include "utils/WriteOnce.hpp"

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PK {

struct PathConfiguration;

/**
 * Factory for Names and Paths, and the single place where paths are hashed,
 * compared and rendered.
 *
 * Every Name goes through the display pipeline first; the canonical pipeline
 * then runs on the display string. equalityUsesCanonicalForm selects which of
 * the two strings hash() and compare() look at.
 *
 * Two-phase initialization: construct the service, construct the owning file
 * system with it, then call setFileSystem() once before paths escape to other
 * threads. Everything else is immutable, so a bound service can be shared
 * across threads without locking.
 */
class PathService {
public:
    PathService(PathType type,
                NormalizationPipeline displayNormalization,
                NormalizationPipeline canonicalNormalization,
                bool                  equalityUsesCanonicalForm);

    static auto create(PathConfiguration const& configuration) -> Expected<std::unique_ptr<PathService>>;

    PathService(PathService const&)            = delete;
    PathService& operator=(PathService const&) = delete;
    PathService(PathService&&)                 = delete;
    PathService& operator=(PathService&&)      = delete;

    auto setFileSystem(FileSystem const& fileSystem) -> Expected<void>;
    auto fileSystem() const noexcept -> FileSystem const*;

    auto pathType() const noexcept -> PathType const& { return type_; }
    auto displayNormalization() const noexcept -> NormalizationPipeline const& { return displayNormalization_; }
    auto canonicalNormalization() const noexcept -> NormalizationPipeline const& { return canonicalNormalization_; }
    auto equalityUsesCanonicalForm() const noexcept -> bool { return equalityUsesCanonicalForm_; }
    auto getSeparator() const noexcept -> std::string_view;

    auto name(std::string_view raw) const -> Name;
    auto names(std::span<std::string const> raw) const -> std::vector<Name>;
    auto names(std::span<std::string_view const> raw) const -> std::vector<Name>;

    auto emptyPath() const -> Path;
    auto createRoot(Name root) const -> Path;
    auto createFileName(Name name) const -> Path;
    auto createRelativePath(std::vector<Name> names) const -> Path;
    auto createPath(std::optional<Name> root, std::vector<Name> names) const -> Path;

    // Empty strings are dropped before joining, so parsePath("", "foo") is "foo".
    auto parsePath(std::span<std::string_view const> parts) const -> Expected<Path>;
    template <typename... More>
    auto parsePath(std::string_view first, More const&... more) const -> Expected<Path> {
        std::array<std::string_view, 1 + sizeof...(More)> parts{first, std::string_view{more}...};
        return parsePath(std::span<std::string_view const>{parts});
    }

    auto toString(Path const& path) const -> std::string;
    auto hash(Path const& path) const -> std::size_t;
    auto compare(Path const& lhs, Path const& rhs) const -> int;
    // The string of a Name that takes part in equality under this service.
    auto form(Name const& name) const noexcept -> std::string_view;

    auto createPathMatcher(std::string_view syntaxAndPattern) const -> Expected<PathMatcher>;

private:
    PathType                    type_;
    NormalizationPipeline       displayNormalization_;
    NormalizationPipeline       canonicalNormalization_;
    bool                        equalityUsesCanonicalForm_;
    WriteOnce<FileSystem const> fileSystem_;
};

} // namespace PK
