#pragma once
#include "core/Error.hpp"
#include "name/Normalization.hpp"
#include "path/PathType.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace PK {

struct PathConfiguration {
    enum class Syntax {
        Posix,
        Windows
    };

    Syntax                     syntax = Syntax::Posix;
    std::vector<Normalization> displayNormalization;
    std::vector<Normalization> canonicalNormalization;
    bool                       equalityUsesCanonicalForm = false;

    // No normalization, exact equality.
    static auto posix() -> PathConfiguration;
    // Display NFC; canonical NFD + ASCII case fold; equality on display form.
    static auto osx() -> PathConfiguration;
    // Canonical ASCII case fold; equality on canonical form.
    static auto windows() -> PathConfiguration;
};

[[nodiscard]] auto syntaxToString(PathConfiguration::Syntax syntax) -> std::string_view;
[[nodiscard]] auto pathTypeFor(PathConfiguration::Syntax syntax) -> PathType;

/*
 * {
 *   "syntax": "posix" | "windows",
 *   "display_normalization": ["nfc"],
 *   "canonical_normalization": ["nfd", "case_fold_ascii"],
 *   "equality_uses_canonical_form": false
 * }
 */
[[nodiscard]] auto parsePathConfiguration(std::string_view json) -> Expected<PathConfiguration>;
[[nodiscard]] auto pathConfigurationToJson(PathConfiguration const& configuration, int indent = -1) -> std::string;

} // namespace PK
