#include <gtest/gtest.h>

#include <chrono>

#include "mocks/gemini_fixtures.hpp"
#include "src/gemini/protocol/constants.hpp"
#include "src/gemini/session/session.hpp"

using namespace gemini::session;
using std::chrono::seconds;
using std::chrono::steady_clock;

namespace {
    const char* const PSID = gemini::protocol::CookieNames::SECURE_1PSID;
    const char* const PSIDTS = gemini::protocol::CookieNames::SECURE_1PSIDTS;
}

TEST(SessionTest, RequiresFactory) { EXPECT_THROW(Session(SessionOptions{}, nullptr), std::invalid_argument); }

TEST(SessionTest, TransportUnavailableBeforeInstall) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    Session session(SessionOptions{}, mocks::make_factory(script));

    EXPECT_FALSE(session.is_running());
    EXPECT_THROW((void)session.transport(), std::logic_error);
}

TEST(SessionTest, InstallClosesPreviousTransport) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    Session session(SessionOptions{}, mocks::make_factory(script));

    session.install(session.make_transport(), "t1", {});
    session.install(session.make_transport(), "t2", {});
    EXPECT_EQ(script->close_calls_, 1);
    EXPECT_EQ(session.access_token(), "t2");

    session.close();
    EXPECT_EQ(script->close_calls_, 2);
}

TEST(SessionTest, CloseIsIdempotentAndRunsOnDestruction) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    {
        Session session(SessionOptions{}, mocks::make_factory(script));
        session.install(session.make_transport(), "t", {});
        session.close();
        session.close();
        EXPECT_TRUE(session.is_closed());
        EXPECT_FALSE(session.is_running());
    }
    EXPECT_EQ(script->close_calls_, 1);

    {
        Session session(SessionOptions{}, mocks::make_factory(script));
        session.install(session.make_transport(), "t", {});
    }
    EXPECT_EQ(script->close_calls_, 2);
}

TEST(SessionTest, TransportOptionsFollowSessionOptions) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    SessionOptions options;
    options.timeout_s_ = 7;
    options.proxy_ = "http://proxy:3128";
    options.verify_tls_ = false;
    Session session(options, mocks::make_factory(script));

    (void)session.make_transport();
    ASSERT_EQ(script->transport_options_.size(), 1u);
    EXPECT_EQ(script->transport_options_[0].timeout_s_, 7);
    EXPECT_EQ(script->transport_options_[0].proxy_, "http://proxy:3128");
    EXPECT_FALSE(script->transport_options_[0].verify_tls_);
    EXPECT_TRUE(script->transport_options_[0].default_headers_.empty());
}

TEST(SessionTest, RequestIdsAdvanceByFixedStep) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    Session session(SessionOptions{}, mocks::make_factory(script));

    const long first = session.next_request_id();
    EXPECT_GE(first, 1000);
    EXPECT_LE(first, 9999);
    EXPECT_EQ(session.next_request_id(), first + 100000);
}

TEST(SessionTest, WithCookiesAddsHeader) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    Session session(SessionOptions{}, mocks::make_factory(script));
    session.install(session.make_transport(), "t", {{"a", "1"}});

    const auto req = session.with_cookies(http::model::Request{});
    ASSERT_EQ(req.headers_.size(), 1u);
    EXPECT_EQ(req.headers_[0], "Cookie: a=1");
}

TEST(SessionTest, RotationDueOnlyAfterInterval) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    SessionOptions options;
    options.refresh_interval_s_ = 60;
    Session session(options, mocks::make_factory(script));

    const auto t0 = steady_clock::now();
    EXPECT_FALSE(session.rotation_due(t0));

    session.mark_rotated(t0);
    EXPECT_FALSE(session.rotation_due(t0 + seconds(59)));
    EXPECT_TRUE(session.rotation_due(t0 + seconds(60)));
}

TEST(SessionTest, RotationNeverDueWithAutoRefreshOff) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    SessionOptions options;
    options.auto_refresh_ = false;
    Session session(options, mocks::make_factory(script));

    const auto t0 = steady_clock::now();
    session.mark_rotated(t0);
    EXPECT_FALSE(session.rotation_due(t0 + seconds(100000)));
}

TEST(SessionTest, RefreshReplacesTimestampCookieWhenDue) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    script->on("POST", "RotateCookies", mocks::response(200, "", {std::string(PSIDTS) + "=fresh; Secure"}));

    SessionOptions options;
    options.refresh_interval_s_ = 1;
    Session session(options, mocks::make_factory(script));
    session.install(session.make_transport(), "t", {{PSID, "sid"}, {PSIDTS, "stale"}});
    session.mark_rotated(steady_clock::now() - seconds(5));

    session.refresh_if_due();
    EXPECT_EQ(session.cookies().at(PSIDTS), "fresh");
    EXPECT_EQ(script->count("POST", "RotateCookies"), 1u);

    // Just rotated, so nothing is sent again.
    session.refresh_if_due();
    EXPECT_EQ(script->count("POST", "RotateCookies"), 1u);
}

TEST(SessionTest, RefreshFailureKeepsCookies) {
    auto script = std::make_shared<mocks::MockHttpScript>();
    script->on("POST", "RotateCookies", mocks::response(401));

    SessionOptions options;
    options.refresh_interval_s_ = 1;
    Session session(options, mocks::make_factory(script));
    session.install(session.make_transport(), "t", {{PSID, "sid"}, {PSIDTS, "stale"}});
    session.mark_rotated(steady_clock::now() - seconds(5));

    EXPECT_NO_THROW(session.refresh_if_due());
    EXPECT_EQ(session.cookies().at(PSIDTS), "stale");
}
