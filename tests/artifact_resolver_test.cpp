#include <gtest/gtest.h>

#include <deque>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "src/gemini/artifact/artifact_resolver.hpp"
#include "src/gemini/error/gemini_error.hpp"

using namespace gemini::artifact;
using gemini::dispatch::ImageRef;
using gemini::dispatch::Request;
using gemini::dispatch::ResponseEnvelope;

namespace {
    const char* const PLACEHOLDER = "http://googleusercontent.com/image_generation_content/0";

    class FakeDispatcher : public gemini::dispatch::IRequestDispatcher {
       public:
        ResponseEnvelope dispatch(const Request& request) override { return dispatch_once(request); }

        ResponseEnvelope dispatch_once(const Request& request) override {
            models_.push_back(request.model_);
            if (replies_.empty()) {
                throw std::logic_error("no scripted reply for " + request.model_);
            }
            ResponseEnvelope envelope = replies_.front();
            replies_.pop_front();
            envelope.model_ = request.model_;
            return envelope;
        }

        std::deque<ResponseEnvelope> replies_;
        std::vector<std::string> models_;
    };

    class FakeStore : public IImageStore {
       public:
        void save(const ImageRef& image, const std::filesystem::path& destination) override {
            saved_.push_back(image);
            destinations_.push_back(destination);
            if (fail_urls_contains_ != "" && image.url_.find(fail_urls_contains_) != std::string::npos) {
                throw std::runtime_error("download failed");
            }
        }

        std::vector<ImageRef> saved_;
        std::vector<std::filesystem::path> destinations_;
        std::string fail_urls_contains_;
    };

    ImageRef generated(const std::string& url) { return ImageRef{.url_ = url, .title_ = "", .alt_ = "", .generated_ = true}; }

    ResponseEnvelope envelope(const std::string& text, std::vector<ImageRef> images = {}, const std::string& raw = "") {
        ResponseEnvelope e;
        e.text_ = text;
        e.images_ = std::move(images);
        e.raw_body_ = raw;
        e.model_ = "gemini-3.0-pro";
        return e;
    }

    Request request() {
        Request r;
        r.prompt_ = "Generate an image: a cat";
        r.model_ = "gemini-3.0-pro";
        return r;
    }

    class ArtifactResolverTest : public ::testing::Test {
       protected:
        FakeDispatcher dispatcher_;
        FakeStore store_;
        ArtifactResolver resolver_{dispatcher_, store_};
        std::filesystem::path out_ = "cat.png";
    };
}  // namespace

TEST_F(ArtifactResolverTest, StructuredImagesWinAndSaveFirst) {
    const auto outcome = resolver_.resolve(
        request(), envelope("Here", {generated("https://a/1"), generated("https://a/2")}, "https://lh3.googleusercontent.com/gg-dl/raw"), out_);

    ASSERT_TRUE(outcome.resolved());
    EXPECT_EQ(outcome.tier_, ResolutionTier::STRUCTURED);
    EXPECT_EQ(outcome.image_count_, 2u);
    ASSERT_EQ(store_.saved_.size(), 1u);
    EXPECT_EQ(store_.saved_[0].url_, "https://a/1");
    EXPECT_EQ(store_.destinations_[0], out_);
    EXPECT_TRUE(dispatcher_.models_.empty());
}

TEST_F(ArtifactResolverTest, StructuredSaveFailurePropagates) {
    store_.fail_urls_contains_ = "https://a/1";

    EXPECT_THROW((void)resolver_.resolve(request(), envelope("Here", {generated("https://a/1")}, "https://lh3.googleusercontent.com/gg-dl/raw"), out_),
                 std::runtime_error);
    EXPECT_EQ(store_.saved_.size(), 1u);
}

TEST_F(ArtifactResolverTest, RawScanSavesFirstUrlAndCountsAll) {
    const std::string raw =
        R"(["https://lh3.googleusercontent.com/gg-dl/u1","https://lh3.googleusercontent.com/gg-dl/u2",)"
        R"("https://lh3.googleusercontent.com/gg-dl/u1","https://lh3.googleusercontent.com/gg-dl/u3"])";

    const auto outcome = resolver_.resolve(request(), envelope(PLACEHOLDER, {}, raw), out_);

    ASSERT_TRUE(outcome.resolved());
    EXPECT_EQ(outcome.tier_, ResolutionTier::RAW_SCAN);
    EXPECT_EQ(outcome.image_count_, 3u);
    ASSERT_EQ(store_.saved_.size(), 1u);
    EXPECT_EQ(store_.saved_[0].url_, "https://lh3.googleusercontent.com/gg-dl/u1");
    EXPECT_TRUE(store_.saved_[0].generated_);
    EXPECT_TRUE(dispatcher_.models_.empty());
}

TEST_F(ArtifactResolverTest, RawScanDownloadFailureFallsThroughToRetry) {
    store_.fail_urls_contains_ = "gg-dl/u1";
    dispatcher_.replies_ = {envelope("Retried", {generated("https://a/retry")})};

    const auto outcome = resolver_.resolve(request(), envelope(PLACEHOLDER, {}, "https://lh3.googleusercontent.com/gg-dl/u1"), out_);

    ASSERT_TRUE(outcome.resolved());
    EXPECT_EQ(outcome.tier_, ResolutionTier::PLACEHOLDER_RETRY);
    EXPECT_EQ(outcome.artifact_->image_.url_, "https://a/retry");
    ASSERT_EQ(dispatcher_.models_.size(), 1u);
    EXPECT_EQ(dispatcher_.models_[0], "gemini-2.5-flash");
}

TEST_F(ArtifactResolverTest, PlaceholderRetryStopsAtFirstModelWithImages) {
    dispatcher_.replies_ = {envelope("m1", {generated("https://a/m1")}), envelope("m2", {generated("https://a/m2")})};

    ArtifactResolver resolver(dispatcher_, store_, FallbackPlan::of({"m1", "m2"}));
    const auto outcome = resolver.resolve(request(), envelope(PLACEHOLDER), out_);

    ASSERT_TRUE(outcome.resolved());
    EXPECT_EQ(dispatcher_.models_, std::vector<std::string>({"m1"}));
    EXPECT_EQ(outcome.fallback_model_.value(), "m1");
    EXPECT_EQ(outcome.envelope_.text_, "m1");
    EXPECT_EQ(store_.saved_[0].url_, "https://a/m1");
}

TEST_F(ArtifactResolverTest, PlaceholderRetryTriesEveryModelInOrder) {
    dispatcher_.replies_ = {envelope(PLACEHOLDER), envelope("pro", {generated("https://a/pro")})};

    const auto outcome = resolver_.resolve(request(), envelope(PLACEHOLDER), out_);

    ASSERT_TRUE(outcome.resolved());
    EXPECT_EQ(dispatcher_.models_, std::vector<std::string>({"gemini-2.5-flash", "gemini-2.5-pro"}));
    EXPECT_EQ(outcome.fallback_model_.value(), "gemini-2.5-pro");
}

TEST_F(ArtifactResolverTest, PlaceholderRetrySkipsModelAlreadyTried) {
    dispatcher_.replies_ = {envelope("pro", {generated("https://a/pro")})};

    ResponseEnvelope first = envelope(PLACEHOLDER);
    first.model_ = "gemini-2.5-flash";
    const auto outcome = resolver_.resolve(request(), first, out_);

    ASSERT_TRUE(outcome.resolved());
    EXPECT_EQ(dispatcher_.models_, std::vector<std::string>({"gemini-2.5-pro"}));
}

TEST_F(ArtifactResolverTest, RetryFailurePropagates) {
    ArtifactResolver resolver(dispatcher_, store_, FallbackPlan::of({"m1"}));

    EXPECT_THROW((void)resolver.resolve(request(), envelope(PLACEHOLDER), out_), std::logic_error);
}

TEST_F(ArtifactResolverTest, NothingFoundSurfacesTextVerbatim) {
    const auto outcome = resolver_.resolve(request(), envelope("I can't draw that, but here's a poem."), out_);

    EXPECT_FALSE(outcome.resolved());
    EXPECT_EQ(outcome.tier_, ResolutionTier::NONE);
    EXPECT_EQ(outcome.display_text(), "I can't draw that, but here's a poem.");
    EXPECT_TRUE(store_.saved_.empty());
    EXPECT_TRUE(dispatcher_.models_.empty());
}

TEST_F(ArtifactResolverTest, EmptyTextShowsMarker) {
    const auto outcome = resolver_.resolve(request(), envelope(""), out_);

    EXPECT_FALSE(outcome.resolved());
    EXPECT_EQ(outcome.display_text(), "(empty response)");
}

TEST_F(ArtifactResolverTest, RetriesWithoutImagesAreUnresolved) {
    dispatcher_.replies_ = {envelope(PLACEHOLDER), envelope("still nothing")};

    const auto outcome = resolver_.resolve(request(), envelope(PLACEHOLDER), out_);

    EXPECT_FALSE(outcome.resolved());
    EXPECT_EQ(dispatcher_.models_.size(), 2u);
    EXPECT_EQ(outcome.display_text(), "still nothing");
}

TEST(FallbackPlanTest, DuplicatesAreDropped) {
    EXPECT_EQ(FallbackPlan::of({"a", "b", "a", "c", "b"}).models_, std::vector<std::string>({"a", "b", "c"}));
}
