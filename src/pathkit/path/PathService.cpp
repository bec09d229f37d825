#include "path/PathService.hpp"

#include "config/PathConfiguration.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace {

[[nodiscard]] auto hash_combine(std::size_t seed, std::size_t value) -> std::size_t {
    constexpr std::size_t kMagic = 0x9e3779b97f4a7c15ULL;
    seed ^= value + kMagic + (seed << 6U) + (seed >> 2U);
    return seed;
}

[[nodiscard]] auto compare_text(std::string_view lhs, std::string_view rhs) -> int {
    auto const result = lhs.compare(rhs);
    return result < 0 ? -1 : (result > 0 ? 1 : 0);
}

} // namespace

namespace PK {

PathService::PathService(PathType              type,
                         NormalizationPipeline displayNormalization,
                         NormalizationPipeline canonicalNormalization,
                         bool                  equalityUsesCanonicalForm)
    : type_(std::move(type)),
      displayNormalization_(std::move(displayNormalization)),
      canonicalNormalization_(std::move(canonicalNormalization)),
      equalityUsesCanonicalForm_(equalityUsesCanonicalForm) {}

auto PathService::create(PathConfiguration const& configuration) -> Expected<std::unique_ptr<PathService>> {
    auto display = NormalizationPipeline::create(configuration.displayNormalization);
    if (!display) {
        return std::unexpected(display.error());
    }
    auto canonical = NormalizationPipeline::create(configuration.canonicalNormalization);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return std::make_unique<PathService>(pathTypeFor(configuration.syntax),
                                         std::move(*display),
                                         std::move(*canonical),
                                         configuration.equalityUsesCanonicalForm);
}

auto PathService::setFileSystem(FileSystem const& fileSystem) -> Expected<void> {
    auto bound = fileSystem_.set(&fileSystem);
    if (!bound) {
        pk_log("Refused to rebind path service to " + std::string(fileSystem.identity()), "PathService", "ERROR");
        return bound;
    }
    pk_log("Bound path service to " + std::string(fileSystem.identity()), "PathService");
    return {};
}

auto PathService::fileSystem() const noexcept -> FileSystem const* {
    return fileSystem_.get();
}

auto PathService::getSeparator() const noexcept -> std::string_view {
    return type_.separator();
}

auto PathService::name(std::string_view raw) const -> Name {
    auto display   = displayNormalization_.apply(raw);
    auto canonical = canonicalNormalization_.apply(display);
    return Name::create(std::move(display), std::move(canonical));
}

auto PathService::names(std::span<std::string const> raw) const -> std::vector<Name> {
    std::vector<Name> result;
    result.reserve(raw.size());
    for (auto const& item : raw) {
        result.push_back(name(item));
    }
    return result;
}

auto PathService::names(std::span<std::string_view const> raw) const -> std::vector<Name> {
    std::vector<Name> result;
    result.reserve(raw.size());
    for (auto const& item : raw) {
        result.push_back(name(item));
    }
    return result;
}

auto PathService::emptyPath() const -> Path {
    return Path{*this, std::nullopt, std::vector<Name>{Name::empty()}};
}

auto PathService::createRoot(Name root) const -> Path {
    return Path{*this, std::move(root), {}};
}

auto PathService::createFileName(Name name) const -> Path {
    return Path{*this, std::nullopt, std::vector<Name>{std::move(name)}};
}

auto PathService::createRelativePath(std::vector<Name> names) const -> Path {
    return createPath(std::nullopt, std::move(names));
}

auto PathService::createPath(std::optional<Name> root, std::vector<Name> names) const -> Path {
    if (!root && names.empty()) {
        return emptyPath();
    }
    return Path{*this, std::move(root), std::move(names)};
}

auto PathService::parsePath(std::span<std::string_view const> parts) const -> Expected<Path> {
    auto parsed = type_.parse(parts);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    std::optional<Name> root;
    if (parsed->root) {
        root = name(*parsed->root);
    }
    std::vector<Name> components;
    components.reserve(parsed->names.size());
    for (auto const& segment : parsed->names) {
        components.push_back(name(segment));
    }
    return createPath(std::move(root), std::move(components));
}

auto PathService::toString(Path const& path) const -> std::string {
    auto const& root = path.rootComponent();
    return type_.render(root ? &*root : nullptr, path.names());
}

auto PathService::form(Name const& name) const noexcept -> std::string_view {
    return equalityUsesCanonicalForm_ ? name.canonical() : name.display();
}

auto PathService::hash(Path const& path) const -> std::size_t {
    auto const& root = path.rootComponent();
    std::size_t seed = root ? hash_combine(1U, std::hash<std::string_view>{}(form(*root))) : 0U;
    for (auto const& name : path.names()) {
        seed = hash_combine(seed, std::hash<std::string_view>{}(form(name)));
    }
    return seed;
}

auto PathService::compare(Path const& lhs, Path const& rhs) const -> int {
    auto const& lhsRoot = lhs.rootComponent();
    auto const& rhsRoot = rhs.rootComponent();
    if (lhsRoot.has_value() != rhsRoot.has_value()) {
        return lhsRoot ? 1 : -1;
    }
    if (lhsRoot) {
        if (auto result = compare_text(form(*lhsRoot), form(*rhsRoot)); result != 0) {
            return result;
        }
    }

    auto const lhsNames = lhs.names();
    auto const rhsNames = rhs.names();
    auto const shared   = std::min(lhsNames.size(), rhsNames.size());
    for (std::size_t idx = 0; idx < shared; ++idx) {
        if (auto result = compare_text(form(lhsNames[idx]), form(rhsNames[idx])); result != 0) {
            return result;
        }
    }
    if (lhsNames.size() != rhsNames.size()) {
        return lhsNames.size() < rhsNames.size() ? -1 : 1;
    }
    return 0;
}

auto PathService::createPathMatcher(std::string_view syntaxAndPattern) const -> Expected<PathMatcher> {
    return PathMatcher::compile(syntaxAndPattern, type_, canonicalNormalization_.foldsCase());
}

} // namespace PK
