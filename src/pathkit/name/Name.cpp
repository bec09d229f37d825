#include "name/Name.hpp"

#include <utility>

namespace PK {

Name::Name(std::string display, std::string canonical)
    : display_(std::move(display)), canonical_(std::move(canonical)) {}

auto Name::simple(std::string_view value) -> Name {
    return Name{std::string{value}, std::string{value}};
}

auto Name::create(std::string display, std::string canonical) -> Name {
    return Name{std::move(display), std::move(canonical)};
}

auto Name::empty() -> Name {
    return Name{std::string{}, std::string{}};
}

auto Name::self() -> Name {
    return simple(".");
}

auto Name::parent() -> Name {
    return simple("..");
}

} // namespace PK
