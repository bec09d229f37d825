#pragma once
#include "core/Error.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PK {

enum class Normalization {
    NFC,
    NFD,
    CaseFoldAscii,
    CaseFoldUnicode
};

[[nodiscard]] auto normalizationToString(Normalization normalization) -> std::string_view;
[[nodiscard]] auto parseNormalization(std::string_view name) -> Expected<Normalization>;

// Applies a single step. Unicode steps return the input unchanged when it is not valid UTF-8.
[[nodiscard]] auto applyNormalization(Normalization normalization, std::string_view text) -> std::string;

/**
 * Ordered, immutable list of normalization steps. Applying the pipeline folds
 * the input through the steps in order.
 */
class NormalizationPipeline {
public:
    NormalizationPipeline() = default;

    // Rejects duplicate steps, NFC together with NFD, and both case folds together.
    static auto create(std::vector<Normalization> steps) -> Expected<NormalizationPipeline>;
    // Comma separated step names, e.g. "nfd, case_fold_ascii". Empty text yields an empty pipeline.
    static auto parse(std::string_view list) -> Expected<NormalizationPipeline>;

    auto apply(std::string_view text) const -> std::string;

    auto steps() const noexcept -> std::span<Normalization const> { return steps_; }
    auto empty() const noexcept -> bool { return steps_.empty(); }
    auto contains(Normalization normalization) const noexcept -> bool;
    auto foldsCase() const noexcept -> bool;
    auto toString() const -> std::string;

private:
    explicit NormalizationPipeline(std::vector<Normalization> steps);

    std::vector<Normalization> steps_;
};

} // namespace PK
