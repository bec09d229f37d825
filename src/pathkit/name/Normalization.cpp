#include "name/Normalization.hpp"

#include "log/TaggedLogger.hpp"

#include <utf8proc.h>

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace {

using PK::Error;
using PK::Expected;
using PK::Normalization;

auto map_utf8(std::string_view text, utf8proc_option_t options, Normalization step) -> std::string {
    if (text.empty()) {
        return {};
    }

    utf8proc_uint8_t* mapped = nullptr;
    auto const        length = utf8proc_map(reinterpret_cast<utf8proc_uint8_t const*>(text.data()),
                                     static_cast<utf8proc_ssize_t>(text.size()),
                                     &mapped,
                                     options);
    if (length < 0) {
        pk_log("Leaving name unchanged for " + std::string(PK::normalizationToString(step)) + ": "
                       + utf8proc_errmsg(length),
               "Normalization");
        return std::string{text};
    }

    std::string result(reinterpret_cast<char const*>(mapped), static_cast<std::size_t>(length));
    std::free(mapped);
    return result;
}

auto fold_ascii(std::string_view text) -> std::string {
    std::string result{text};
    for (auto& ch : result) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
    }
    return result;
}

auto config_error(std::string message) -> Error {
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

} // namespace

namespace PK {

auto normalizationToString(Normalization normalization) -> std::string_view {
    switch (normalization) {
    case Normalization::NFC:
        return "nfc";
    case Normalization::NFD:
        return "nfd";
    case Normalization::CaseFoldAscii:
        return "case_fold_ascii";
    case Normalization::CaseFoldUnicode:
        return "case_fold_unicode";
    }
    return "unknown";
}

auto parseNormalization(std::string_view name) -> Expected<Normalization> {
    for (auto candidate : {Normalization::NFC, Normalization::NFD, Normalization::CaseFoldAscii, Normalization::CaseFoldUnicode}) {
        if (normalizationToString(candidate) == name) {
            return candidate;
        }
    }
    return std::unexpected(config_error("unknown normalization '" + std::string(name) + "'"));
}

auto applyNormalization(Normalization normalization, std::string_view text) -> std::string {
    switch (normalization) {
    case Normalization::NFC:
        return map_utf8(text, static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE), normalization);
    case Normalization::NFD:
        return map_utf8(text, static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_DECOMPOSE), normalization);
    case Normalization::CaseFoldAscii:
        return fold_ascii(text);
    case Normalization::CaseFoldUnicode:
        return map_utf8(text, UTF8PROC_CASEFOLD, normalization);
    }
    return std::string{text};
}

NormalizationPipeline::NormalizationPipeline(std::vector<Normalization> steps)
    : steps_(std::move(steps)) {}

auto NormalizationPipeline::create(std::vector<Normalization> steps) -> Expected<NormalizationPipeline> {
    for (std::size_t idx = 0; idx < steps.size(); ++idx) {
        if (std::find(steps.begin() + static_cast<std::ptrdiff_t>(idx) + 1, steps.end(), steps[idx]) != steps.end()) {
            return std::unexpected(config_error("normalization '" + std::string(normalizationToString(steps[idx]))
                                                + "' listed more than once"));
        }
    }

    auto has = [&steps](Normalization n) { return std::find(steps.begin(), steps.end(), n) != steps.end(); };
    if (has(Normalization::NFC) && has(Normalization::NFD)) {
        return std::unexpected(config_error("nfc and nfd cannot be combined"));
    }
    if (has(Normalization::CaseFoldAscii) && has(Normalization::CaseFoldUnicode)) {
        return std::unexpected(config_error("case_fold_ascii and case_fold_unicode cannot be combined"));
    }
    return NormalizationPipeline{std::move(steps)};
}

auto NormalizationPipeline::parse(std::string_view list) -> Expected<NormalizationPipeline> {
    std::vector<Normalization> steps;
    if (list.empty()) {
        return create(std::move(steps));
    }
    while (true) {
        auto comma = list.find(',');
        auto token = list.substr(0, comma);
        while (!token.empty() && token.front() == ' ')
            token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ')
            token.remove_suffix(1);
        if (token.empty()) {
            return std::unexpected(config_error("empty normalization name"));
        }
        auto step = parseNormalization(token);
        if (!step) {
            return std::unexpected(step.error());
        }
        steps.push_back(*step);
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return create(std::move(steps));
}

auto NormalizationPipeline::apply(std::string_view text) const -> std::string {
    std::string result{text};
    for (auto step : steps_) {
        result = applyNormalization(step, result);
    }
    return result;
}

auto NormalizationPipeline::contains(Normalization normalization) const noexcept -> bool {
    return std::find(steps_.begin(), steps_.end(), normalization) != steps_.end();
}

auto NormalizationPipeline::foldsCase() const noexcept -> bool {
    return contains(Normalization::CaseFoldAscii) || contains(Normalization::CaseFoldUnicode);
}

auto NormalizationPipeline::toString() const -> std::string {
    std::string result;
    for (std::size_t idx = 0; idx < steps_.size(); ++idx) {
        if (idx > 0) {
            result.append(",");
        }
        result.append(normalizationToString(steps_[idx]));
    }
    return result;
}

} // namespace PK
