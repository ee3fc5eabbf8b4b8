#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "mocks/gemini_fixtures.hpp"
#include "src/gemini/artifact/image_store.hpp"
#include "src/http/error/http_error.hpp"

using namespace gemini::artifact;

namespace {
    const char* const GENERATED_URL = "https://lh3.googleusercontent.com/gg-dl/abc";

    http::model::Response image_response(long status, const std::string& content_type, const std::string& body) {
        auto r = mocks::response(status, body);
        r.content_type_ = content_type;
        return r;
    }

    std::string read_file(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    class ImageStoreTest : public ::testing::Test {
       protected:
        void SetUp() override {
            dir_ = std::filesystem::temp_directory_path() /
                   (std::string("gemini_web_store_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            std::filesystem::remove_all(dir_);
        }

        void TearDown() override { std::filesystem::remove_all(dir_); }

        fixtures::BootstrappedSession fx_;
        std::filesystem::path dir_;
    };
}  // namespace

TEST_F(ImageStoreTest, GeneratedImageUsesFullSizeAndCookies) {
    fx_.script_->on("GET", "gg-dl/abc", image_response(200, "image/png", "PNGDATA"));

    ImageStore store(*fx_.session_);
    const auto target = dir_ / "out" / "generated.png";
    store.save(gemini::dispatch::ImageRef{.url_ = GENERATED_URL, .title_ = "", .alt_ = "", .generated_ = true}, target);

    EXPECT_EQ(read_file(target), "PNGDATA");
    EXPECT_FALSE(std::filesystem::exists(target.string() + ".part"));

    const auto gets = fx_.script_->find("GET", "gg-dl/abc");
    ASSERT_EQ(gets.size(), 1u);
    EXPECT_EQ(gets[0].request_.url_, std::string(GENERATED_URL) + "=s2048");
    EXPECT_TRUE(gets[0].has_header("Cookie: NID=harvested; __Secure-1PSID=psid-value"));
}

TEST_F(ImageStoreTest, WebImageIsFetchedAsIs) {
    fx_.script_->on("GET", "example.com", image_response(200, "image/jpeg", "JPG"));

    ImageStore store(*fx_.session_);
    store.save(gemini::dispatch::ImageRef{.url_ = "https://example.com/a.jpg", .title_ = "", .alt_ = "", .generated_ = false}, dir_ / "a.jpg");

    const auto gets = fx_.script_->find("GET", "example.com");
    ASSERT_EQ(gets.size(), 1u);
    EXPECT_EQ(gets[0].request_.url_, "https://example.com/a.jpg");
    EXPECT_TRUE(gets[0].request_.headers_.empty());
}

TEST_F(ImageStoreTest, ErrorStatusLeavesNoFile) {
    fx_.script_->on("GET", "gg-dl/abc", image_response(403, "text/html", "denied"));

    ImageStore store(*fx_.session_);
    const auto target = dir_ / "x.png";
    EXPECT_THROW(store.save(gemini::dispatch::ImageRef{.url_ = GENERATED_URL, .title_ = "", .alt_ = "", .generated_ = true}, target),
                 http::http_error::HttpError);
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(ImageStoreTest, NonImageContentIsRejected) {
    fx_.script_->on("GET", "gg-dl/abc", image_response(200, "text/html; charset=utf-8", "<html>login</html>"));

    ImageStore store(*fx_.session_);
    const auto target = dir_ / "x.png";
    EXPECT_THROW(store.save(gemini::dispatch::ImageRef{.url_ = GENERATED_URL, .title_ = "", .alt_ = "", .generated_ = true}, target),
                 http::http_error::HttpError);
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(ImageStoreTest, WriteAtomicReplacesExistingFile) {
    std::filesystem::create_directories(dir_);
    const auto target = dir_ / "img.png";
    std::ofstream(target) << "old";

    ImageStore::write_atomic(target, "new");
    EXPECT_EQ(read_file(target), "new");
}
