#include <gtest/gtest.h>

#include <string>

#include "src/gemini/error/error_classifier.hpp"

using namespace gemini::gemini_error;

namespace {
    const std::string INVALID = "Failed to generate contents. Invalid response data received.";
}

TEST(ErrorClassifierTest, InvalidResponseWithMarkerIsFeatureUnavailable) {
    const auto c = ErrorClassifier::classify(INVALID, R"()]}'\n[["er",null,null,null,null,400,null,null,null,3],["di",40],["af.httprm",39,"-123",2]])");

    EXPECT_EQ(c.category_, ErrorCategory::FEATURE_UNAVAILABLE_FOR_ACCOUNT);
    EXPECT_EQ(c.message_, INVALID);
    ASSERT_TRUE(c.guidance_.has_value());
    EXPECT_NE(c.guidance_->find("account/region"), std::string::npos);
}

TEST(ErrorClassifierTest, EitherSignalAloneIsUnclassified) {
    EXPECT_EQ(ErrorClassifier::classify(INVALID, "some other body").category_, ErrorCategory::UNCLASSIFIED);
    EXPECT_EQ(ErrorClassifier::classify("Request timed out", "af.httprm").category_, ErrorCategory::UNCLASSIFIED);
    EXPECT_EQ(ErrorClassifier::classify(INVALID, "").category_, ErrorCategory::UNCLASSIFIED);
}

TEST(ErrorClassifierTest, UnclassifiedKeepsMessage) {
    const auto c = ErrorClassifier::classify("Usage limit exceeded", "");
    EXPECT_EQ(c.message_, "Usage limit exceeded");
    EXPECT_FALSE(c.guidance_.has_value());
}

TEST(ErrorClassifierTest, RethrowEnrichedAppendsGuidance) {
    const DispatchFailed original(INVALID, "...af.httprm...");
    try {
        ErrorClassifier::rethrow_enriched(original);
    } catch (const DispatchFailed& e) {
        EXPECT_EQ(e.category_, ErrorCategory::FEATURE_UNAVAILABLE_FOR_ACCOUNT);
        EXPECT_EQ(std::string(e.what()), INVALID + "\n" + FEATURE_UNAVAILABLE_GUIDANCE);
        EXPECT_EQ(e.raw_body_, "...af.httprm...");
        return;
    }
    FAIL() << "rethrow_enriched returned";
}

TEST(ErrorClassifierTest, RethrowEnrichedLeavesOtherFailuresAlone) {
    const DispatchFailed original("Requests from this IP are temporarily blocked.", "body");
    try {
        ErrorClassifier::rethrow_enriched(original);
    } catch (const DispatchFailed& e) {
        EXPECT_EQ(e.category_, ErrorCategory::DISPATCH_FAILED);
        EXPECT_STREQ(e.what(), "Requests from this IP are temporarily blocked.");
        return;
    }
    FAIL() << "rethrow_enriched returned";
}

TEST(ErrorCategoryTest, NamesMatchTaxonomy) {
    EXPECT_STREQ(to_string(ErrorCategory::FEATURE_UNAVAILABLE_FOR_ACCOUNT), "FeatureUnavailableForAccount");
    EXPECT_STREQ(to_string(ErrorCategory::NO_ARTIFACT_RESOLVED), "NoArtifactResolved");
    EXPECT_STREQ(to_string(ErrorCategory::BOOTSTRAP_FAILED), "BootstrapFailed");
}
