#include "name/Normalization.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace PK;

namespace {
// U+00E9 LATIN SMALL LETTER E WITH ACUTE, composed and decomposed.
std::string const kComposed   = "caf\xC3\xA9";
std::string const kDecomposed = "cafe\xCC\x81";
} // namespace

TEST_SUITE("name.normalization") {
    TEST_CASE("Step names round trip") {
        for (auto step : {Normalization::NFC, Normalization::NFD, Normalization::CaseFoldAscii, Normalization::CaseFoldUnicode}) {
            auto parsed = parseNormalization(normalizationToString(step));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == step);
        }

        auto unknown = parseNormalization("nfkc");
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().code == Error::Code::InvalidConfiguration);
    }

    TEST_CASE("Unicode forms") {
        CHECK(applyNormalization(Normalization::NFC, kDecomposed) == kComposed);
        CHECK(applyNormalization(Normalization::NFD, kComposed) == kDecomposed);
        CHECK(applyNormalization(Normalization::NFC, kComposed) == kComposed);
        CHECK(applyNormalization(Normalization::NFD, "") == "");
    }

    TEST_CASE("Case folding") {
        SUBCASE("ASCII only touches A-Z") {
            CHECK(applyNormalization(Normalization::CaseFoldAscii, "Hello.TXT") == "hello.txt");
            // U+00C9 stays upper case
            CHECK(applyNormalization(Normalization::CaseFoldAscii, "\xC3\x89T\xC3\x89") == "\xC3\x89t\xC3\x89");
        }
        SUBCASE("Unicode folds beyond ASCII") {
            CHECK(applyNormalization(Normalization::CaseFoldUnicode, "\xC3\x89T\xC3\x89") == "\xC3\xA9t\xC3\xA9");
        }
    }

    TEST_CASE("Invalid UTF-8 passes through unchanged") {
        std::string const broken = "ab\xFF";
        CHECK(applyNormalization(Normalization::NFC, broken) == broken);
        CHECK(applyNormalization(Normalization::CaseFoldUnicode, broken) == broken);
        CHECK(applyNormalization(Normalization::CaseFoldAscii, "AB\xFF") == "ab\xFF");
    }

    TEST_CASE("Pipeline folds steps in order") {
        auto pipeline = NormalizationPipeline::create({Normalization::NFD, Normalization::CaseFoldAscii});
        REQUIRE(pipeline.has_value());
        CHECK(pipeline->apply("CAF\xC3\x89") == "cafe\xCC\x81");
        CHECK(pipeline->foldsCase());
        CHECK(pipeline->contains(Normalization::NFD));
        CHECK_FALSE(pipeline->contains(Normalization::NFC));
        CHECK(pipeline->toString() == "nfd,case_fold_ascii");

        NormalizationPipeline identity;
        CHECK(identity.empty());
        CHECK_FALSE(identity.foldsCase());
        CHECK(identity.apply("MiXeD") == "MiXeD");
    }

    TEST_CASE("Pipeline validation") {
        SUBCASE("duplicates") {
            auto result = NormalizationPipeline::create({Normalization::NFC, Normalization::NFC});
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::InvalidConfiguration);
        }
        SUBCASE("nfc with nfd") {
            CHECK_FALSE(NormalizationPipeline::create({Normalization::NFC, Normalization::NFD}).has_value());
        }
        SUBCASE("both case folds") {
            CHECK_FALSE(NormalizationPipeline::create({Normalization::CaseFoldAscii, Normalization::CaseFoldUnicode}).has_value());
        }
    }

    TEST_CASE("Pipeline parsing") {
        auto parsed = NormalizationPipeline::parse(" nfc , case_fold_unicode");
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->steps().size() == 2);
        CHECK(parsed->steps()[0] == Normalization::NFC);
        CHECK(parsed->steps()[1] == Normalization::CaseFoldUnicode);

        auto empty = NormalizationPipeline::parse("");
        REQUIRE(empty.has_value());
        CHECK(empty->empty());

        CHECK_FALSE(NormalizationPipeline::parse("nfc,,nfd").has_value());
        CHECK_FALSE(NormalizationPipeline::parse(",nfc").has_value());

        auto trailing = NormalizationPipeline::parse("nfc,");
        REQUIRE_FALSE(trailing.has_value());
        CHECK(trailing.error().code == Error::Code::InvalidConfiguration);
        CHECK_FALSE(NormalizationPipeline::parse("nfd, ").has_value());
        CHECK_FALSE(NormalizationPipeline::parse("lower").has_value());
        CHECK_FALSE(NormalizationPipeline::parse("nfc,nfd").has_value());
    }
}
