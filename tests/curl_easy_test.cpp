#include <gtest/gtest.h>

#include <chrono>

#include "src/http/client/curl_easy.hpp"

using namespace http::client;
using namespace std::chrono;

TEST(RetryAfterDelayTest, ShortHintIsHonoured) {
    const RetryPolicy p{.max_tries_ = 3, .base_delay_ = milliseconds{100}, .max_delay_ = milliseconds{5'000}};
    EXPECT_EQ(CurlEasy::retry_after_delay(p, "2").value(), milliseconds{2'000});
}

TEST(RetryAfterDelayTest, LongHintIsCappedAtPolicyMaximum) {
    const RetryPolicy p{.max_tries_ = 3, .base_delay_ = milliseconds{100}, .max_delay_ = milliseconds{1'500}};
    EXPECT_EQ(CurlEasy::retry_after_delay(p, "3600").value(), milliseconds{1'500});
}

TEST(RetryAfterDelayTest, MissingOrUnparsableHintFallsBackToBackoff) {
    const RetryPolicy p{};
    EXPECT_FALSE(CurlEasy::retry_after_delay(p, "").has_value());
    EXPECT_FALSE(CurlEasy::retry_after_delay(p, "0").has_value());
    EXPECT_FALSE(CurlEasy::retry_after_delay(p, "Wed, 21 Oct 2026 07:28:00 GMT").has_value());
}
