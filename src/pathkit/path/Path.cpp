#include "path/Path.hpp"

#include "path/PathService.hpp"

#include <algorithm>
#include <utility>

namespace PK {

Path::Path(PathService const& service, std::optional<Name> root, std::vector<Name> names)
    : service_(&service), root_(std::move(root)), names_(std::move(names)) {}

auto Path::fileSystem() const noexcept -> FileSystem const* {
    return service_->fileSystem();
}

auto Path::isEmptyPath() const noexcept -> bool {
    return !root_ && names_.size() == 1 && names_.front().isEmpty();
}

auto Path::nameAt(std::size_t index) const -> Expected<Name> {
    if (index >= names_.size()) {
        return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                     "index " + std::to_string(index) + " out of range for " + std::to_string(names_.size())
                                             + " names"});
    }
    return names_[index];
}

auto Path::root() const -> std::optional<Path> {
    if (!root_) {
        return std::nullopt;
    }
    return service_->createRoot(*root_);
}

auto Path::fileName() const -> std::optional<Path> {
    if (names_.empty()) {
        return std::nullopt;
    }
    if (!root_ && names_.size() == 1) {
        return *this;
    }
    return service_->createFileName(names_.back());
}

auto Path::parent() const -> std::optional<Path> {
    if (names_.empty()) {
        return std::nullopt;
    }
    if (names_.size() == 1) {
        return this->root();
    }
    return service_->createPath(root_, std::vector<Name>(names_.begin(), names_.end() - 1));
}

auto Path::subpath(std::size_t beginIndex, std::size_t endIndex) const -> Expected<Path> {
    if (beginIndex >= endIndex || endIndex > names_.size()) {
        return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                     "subpath [" + std::to_string(beginIndex) + ", " + std::to_string(endIndex)
                                             + ") out of range for " + std::to_string(names_.size()) + " names"});
    }
    auto const first = names_.begin() + static_cast<std::ptrdiff_t>(beginIndex);
    auto const last  = names_.begin() + static_cast<std::ptrdiff_t>(endIndex);
    return service_->createRelativePath(std::vector<Name>(first, last));
}

auto Path::sameName(Name const& lhs, Name const& rhs) const -> bool {
    return service_->form(lhs) == service_->form(rhs);
}

auto Path::startsWith(Path const& other) const -> bool {
    if (service_ != other.service_ || isAbsolute() != other.isAbsolute()) {
        return false;
    }
    if (other.isEmptyPath()) {
        return isEmptyPath();
    }
    if (root_ && !sameName(*root_, *other.root_)) {
        return false;
    }
    if (other.names_.size() > names_.size()) {
        return false;
    }
    return std::equal(other.names_.begin(), other.names_.end(), names_.begin(),
                      [this](Name const& lhs, Name const& rhs) { return sameName(lhs, rhs); });
}

auto Path::endsWith(Path const& other) const -> bool {
    if (service_ != other.service_) {
        return false;
    }
    if (other.isAbsolute()) {
        return *this == other;
    }
    if (other.isEmptyPath()) {
        return isEmptyPath();
    }
    if (other.names_.size() > names_.size()) {
        return false;
    }
    return std::equal(other.names_.rbegin(), other.names_.rend(), names_.rbegin(),
                      [this](Name const& lhs, Name const& rhs) { return sameName(lhs, rhs); });
}

auto Path::resolve(Path const& other) const -> Path {
    if (other.isAbsolute()) {
        return other;
    }
    if (other.isEmptyPath()) {
        return *this;
    }
    if (isEmptyPath()) {
        return other;
    }
    std::vector<Name> joined;
    joined.reserve(names_.size() + other.names_.size());
    joined.insert(joined.end(), names_.begin(), names_.end());
    joined.insert(joined.end(), other.names_.begin(), other.names_.end());
    return service_->createPath(root_, std::move(joined));
}

auto Path::resolve(std::string_view other) const -> Expected<Path> {
    auto parsed = service_->parsePath(other);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return resolve(*parsed);
}

auto Path::resolveSibling(Path const& other) const -> Path {
    if (other.isAbsolute()) {
        return other;
    }
    auto parentPath = parent();
    if (!parentPath) {
        return other;
    }
    return parentPath->resolve(other);
}

auto Path::normalize() const -> Path {
    std::vector<Name> kept;
    kept.reserve(names_.size());
    for (auto const& name : names_) {
        if (name.isSelf()) {
            continue;
        }
        if (name.isParent()) {
            if (!kept.empty() && !kept.back().isParent()) {
                kept.pop_back();
            } else if (!root_) {
                kept.push_back(name);
            }
            continue;
        }
        kept.push_back(name);
    }
    return service_->createPath(root_, std::move(kept));
}

auto Path::relativize(Path const& other) const -> Expected<Path> {
    if (service_ != other.service_) {
        return std::unexpected(Error{Error::Code::InvalidPath, "paths belong to different path services"});
    }
    if (isAbsolute() != other.isAbsolute()) {
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "cannot relativize '" + other.toString() + "' against '" + toString()
                                             + "': only one of them is absolute"});
    }
    if (root_ && !sameName(*root_, *other.root_)) {
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "cannot relativize '" + other.toString() + "' against '" + toString()
                                             + "': different roots"});
    }
    if (isEmptyPath()) {
        return other;
    }

    std::span<Name const> const base   = names_;
    std::span<Name const> const target = other.isEmptyPath() ? std::span<Name const>{} : std::span<Name const>{other.names_};

    std::size_t common = 0;
    while (common < base.size() && common < target.size() && sameName(base[common], target[common])) {
        ++common;
    }

    std::vector<Name> relative;
    relative.reserve(base.size() - common + target.size() - common);
    for (std::size_t idx = common; idx < base.size(); ++idx) {
        relative.push_back(Name::parent());
    }
    relative.insert(relative.end(), target.begin() + static_cast<std::ptrdiff_t>(common), target.end());
    return service_->createRelativePath(std::move(relative));
}

auto Path::toString() const -> std::string {
    return service_->toString(*this);
}

auto Path::hash() const -> std::size_t {
    return service_->hash(*this);
}

auto Path::compareTo(Path const& other) const -> int {
    return service_->compare(*this, other);
}

auto Path::operator==(Path const& other) const -> bool {
    return service_ == other.service_ && compareTo(other) == 0;
}

auto Path::operator<=>(Path const& other) const -> std::strong_ordering {
    if (service_ != other.service_) {
        return std::compare_three_way{}(service_, other.service_);
    }
    auto const result = compareTo(other);
    if (result < 0) {
        return std::strong_ordering::less;
    }
    if (result > 0) {
        return std::strong_ordering::greater;
    }
    return std::strong_ordering::equal;
}

} // namespace PK
