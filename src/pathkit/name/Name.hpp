#pragma once
#include <string>
#include <string_view>

namespace PK {

/**
 * One path segment or root marker. The display string is what gets rendered;
 * the canonical string is derived from it by the canonical normalization
 * pipeline. Names have no equality of their own: PathService decides which of
 * the two strings takes part in hashing and comparison.
 */
class Name {
public:
    // display == canonical
    static auto simple(std::string_view value) -> Name;
    // The caller guarantees canonical is the canonical form of display.
    static auto create(std::string display, std::string canonical) -> Name;

    static auto empty() -> Name;
    static auto self() -> Name;
    static auto parent() -> Name;

    auto display() const noexcept -> std::string_view { return display_; }
    auto canonical() const noexcept -> std::string_view { return canonical_; }

    auto isEmpty() const noexcept -> bool { return display_.empty(); }
    auto isSelf() const noexcept -> bool { return display_ == "."; }
    auto isParent() const noexcept -> bool { return display_ == ".."; }

private:
    Name(std::string display, std::string canonical);

    std::string display_;
    std::string canonical_;
};

} // namespace PK
