#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>

#include "src/config/client_config.hpp"

using config::ClientConfig;
using config::EnvKeys;

namespace {
    config::EnvLookup lookup_from(std::map<std::string, std::string> env) {
        return [env = std::move(env)](const char* key) -> std::optional<std::string> {
            const auto it = env.find(key);
            if (it == env.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }
}  // namespace

TEST(ClientConfigTest, DefaultsWhenEnvironmentIsEmpty) {
    const auto c = ClientConfig::from_lookup(lookup_from({}));

    EXPECT_FALSE(c.cookies_.explicit_cookies_.has_value());
    EXPECT_FALSE(c.cookies_.secure_1psid_.has_value());
    EXPECT_EQ(c.session_.timeout_s_, 120);
    EXPECT_EQ(c.session_.refresh_interval_s_, 540);
    EXPECT_TRUE(c.session_.auto_refresh_);
    EXPECT_TRUE(c.session_.verify_tls_);
    EXPECT_TRUE(c.session_.proxy_.empty());
}

TEST(ClientConfigTest, CookieJsonDropsNullsAndStringifiesScalars) {
    const auto cookies = ClientConfig::parse_cookie_json(R"({"__Secure-1PSID":"sid","NID":null,"num":42,"flag":true})");

    ASSERT_TRUE(cookies.has_value());
    EXPECT_EQ(cookies->size(), 3u);
    EXPECT_EQ(cookies->at("__Secure-1PSID"), "sid");
    EXPECT_EQ(cookies->at("num"), "42");
    EXPECT_EQ(cookies->at("flag"), "true");
    EXPECT_FALSE(cookies->contains("NID"));
}

TEST(ClientConfigTest, MalformedCookieJsonIsIgnored) {
    EXPECT_FALSE(ClientConfig::parse_cookie_json("{not json").has_value());
    EXPECT_FALSE(ClientConfig::parse_cookie_json(R"(["a","b"])").has_value());

    const auto c = ClientConfig::from_lookup(lookup_from({{EnvKeys::COOKIES_JSON, "{oops"}, {EnvKeys::SECURE_1PSID, "sid"}}));
    EXPECT_FALSE(c.cookies_.explicit_cookies_.has_value());
    EXPECT_EQ(c.cookies_.secure_1psid_.value(), "sid");
}

TEST(ClientConfigTest, JsonMapBeatsLegacyVariables) {
    const auto c = ClientConfig::from_lookup(lookup_from({
        {EnvKeys::COOKIES_JSON, R"({"__Secure-1PSID":"from-json"})"},
        {EnvKeys::SECURE_1PSID, "from-env"},
        {EnvKeys::SECURE_1PSIDTS, "ts-env"},
    }));

    EXPECT_EQ(c.cookies_.secure_1psid_.value(), "from-json");
    EXPECT_EQ(c.cookies_.secure_1psidts_.value(), "ts-env");
}

TEST(ClientConfigTest, TransportSettings) {
    const auto c = ClientConfig::from_lookup(lookup_from({
        {EnvKeys::PROXY, "socks5://127.0.0.1:1080"},
        {EnvKeys::TIMEOUT_S, "30"},
        {EnvKeys::AUTO_REFRESH, "false"},
        {EnvKeys::REFRESH_INTERVAL_S, "60"},
        {EnvKeys::VERIFY_TLS, "0"},
    }));

    EXPECT_EQ(c.session_.proxy_, "socks5://127.0.0.1:1080");
    EXPECT_EQ(c.session_.timeout_s_, 30);
    EXPECT_FALSE(c.session_.auto_refresh_);
    EXPECT_EQ(c.session_.refresh_interval_s_, 60);
    EXPECT_FALSE(c.session_.verify_tls_);
}

TEST(ClientConfigTest, UnparseableValuesFallBackToDefaults) {
    const auto c = ClientConfig::from_lookup(lookup_from({
        {EnvKeys::TIMEOUT_S, "soon"},
        {EnvKeys::REFRESH_INTERVAL_S, "-5"},
        {EnvKeys::AUTO_REFRESH, "maybe"},
    }));

    EXPECT_EQ(c.session_.timeout_s_, 120);
    EXPECT_EQ(c.session_.refresh_interval_s_, 540);
    EXPECT_TRUE(c.session_.auto_refresh_);
}
