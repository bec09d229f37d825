#include "config/PathConfiguration.hpp"

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace {

using PK::Error;
using PK::Expected;
using PK::Normalization;
using PK::PathConfiguration;
using json = nlohmann::json;

auto config_error(std::string message) -> Error {
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

auto parse_syntax(std::string_view text) -> Expected<PathConfiguration::Syntax> {
    if (text == "posix") {
        return PathConfiguration::Syntax::Posix;
    }
    if (text == "windows") {
        return PathConfiguration::Syntax::Windows;
    }
    return std::unexpected(config_error("unknown syntax '" + std::string(text) + "'"));
}

auto parse_steps(json const& document, char const* key) -> Expected<std::vector<Normalization>> {
    std::vector<Normalization> steps;
    if (!document.contains(key)) {
        return steps;
    }
    auto const& entries = document[key];
    if (!entries.is_array()) {
        return std::unexpected(config_error(std::string(key) + " must be an array"));
    }
    for (auto const& entry : entries) {
        if (!entry.is_string()) {
            return std::unexpected(config_error(std::string(key) + " entries must be strings"));
        }
        auto step = PK::parseNormalization(entry.get<std::string>());
        if (!step) {
            return std::unexpected(step.error());
        }
        steps.push_back(*step);
    }
    return steps;
}

auto steps_json(std::vector<Normalization> const& steps) -> json {
    json array = json::array();
    for (auto step : steps) {
        array.push_back(std::string(PK::normalizationToString(step)));
    }
    return array;
}

} // namespace

namespace PK {

auto PathConfiguration::posix() -> PathConfiguration {
    return PathConfiguration{};
}

auto PathConfiguration::osx() -> PathConfiguration {
    PathConfiguration configuration;
    configuration.displayNormalization   = {Normalization::NFC};
    configuration.canonicalNormalization = {Normalization::NFD, Normalization::CaseFoldAscii};
    return configuration;
}

auto PathConfiguration::windows() -> PathConfiguration {
    PathConfiguration configuration;
    configuration.syntax                    = Syntax::Windows;
    configuration.canonicalNormalization    = {Normalization::CaseFoldAscii};
    configuration.equalityUsesCanonicalForm = true;
    return configuration;
}

auto syntaxToString(PathConfiguration::Syntax syntax) -> std::string_view {
    switch (syntax) {
    case PathConfiguration::Syntax::Posix:
        return "posix";
    case PathConfiguration::Syntax::Windows:
        return "windows";
    }
    return "posix";
}

auto pathTypeFor(PathConfiguration::Syntax syntax) -> PathType {
    return syntax == PathConfiguration::Syntax::Windows ? PathType::windows() : PathType::posix();
}

auto parsePathConfiguration(std::string_view text) -> Expected<PathConfiguration> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        pk_log("Path configuration is not valid JSON", "Config", "ERROR");
        return std::unexpected(Error{Error::Code::MalformedInput, "path configuration is not valid JSON"});
    }
    if (!document.is_object()) {
        return std::unexpected(config_error("path configuration must be a JSON object"));
    }
    if (!document.contains("syntax") || !document["syntax"].is_string()) {
        return std::unexpected(config_error("syntax is required and must be a string"));
    }

    PathConfiguration configuration;
    auto syntax = parse_syntax(document["syntax"].get<std::string>());
    if (!syntax) {
        return std::unexpected(syntax.error());
    }
    configuration.syntax = *syntax;

    auto display = parse_steps(document, "display_normalization");
    if (!display) {
        return std::unexpected(display.error());
    }
    configuration.displayNormalization = std::move(*display);

    auto canonical = parse_steps(document, "canonical_normalization");
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    configuration.canonicalNormalization = std::move(*canonical);

    if (document.contains("equality_uses_canonical_form")) {
        auto const& flag = document["equality_uses_canonical_form"];
        if (!flag.is_boolean()) {
            return std::unexpected(config_error("equality_uses_canonical_form must be a boolean"));
        }
        configuration.equalityUsesCanonicalForm = flag.get<bool>();
    }

    pk_log("Loaded " + std::string(syntaxToString(configuration.syntax)) + " path configuration", "Config");
    return configuration;
}

auto pathConfigurationToJson(PathConfiguration const& configuration, int indent) -> std::string {
    json document{{"syntax", std::string(syntaxToString(configuration.syntax))},
                  {"display_normalization", steps_json(configuration.displayNormalization)},
                  {"canonical_normalization", steps_json(configuration.canonicalNormalization)},
                  {"equality_uses_canonical_form", configuration.equalityUsesCanonicalForm}};
    return document.dump(indent);
}

} // namespace PK
