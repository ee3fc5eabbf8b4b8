#include "session_bootstrapper.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>

#include "../error/gemini_error.hpp"
#include "../protocol/constants.hpp"
#include "../protocol/patterns.hpp"
#include "cookie_rotator.hpp"

namespace gemini::session {
    http::cookie::CookieMap SessionBootstrapper::merge_inputs(const CookieInputs& inputs) {
        http::cookie::CookieMap merged;

        if (inputs.secure_1psid_ && !inputs.secure_1psid_->empty()) {
            merged[gemini::protocol::CookieNames::SECURE_1PSID] = *inputs.secure_1psid_;
        }
        if (inputs.secure_1psidts_ && !inputs.secure_1psidts_->empty()) {
            merged[gemini::protocol::CookieNames::SECURE_1PSIDTS] = *inputs.secure_1psidts_;
        }
        if (inputs.explicit_cookies_) {
            http::cookie::merge_over(merged, *inputs.explicit_cookies_);
        }

        return merged;
    }

    void SessionBootstrapper::try_rotate(Session& session, http::client::IHttpClient& transport, http::cookie::CookieMap& cookies) {
        if (!CookieRotator::can_rotate(cookies)) {
            return;
        }

        session.mark_rotated(std::chrono::steady_clock::now());
        try {
            if (auto rotated = CookieRotator::rotate(transport, cookies)) {
                cookies[gemini::protocol::CookieNames::SECURE_1PSIDTS] = std::move(*rotated);
                spdlog::debug("Rotated {} before bootstrap", gemini::protocol::CookieNames::SECURE_1PSIDTS);
            }
        } catch (const std::exception& e) {
            spdlog::debug("Cookie rotation failed, using the supplied value: {}", e.what());
        }
    }

    http::model::Response SessionBootstrapper::fetch(http::client::IHttpClient& transport, http::model::Request req, const char* what) {
        try {
            return transport.get(req);
        } catch (const std::exception& e) {
            throw gemini_error::BootstrapFailed(std::string("Failed to load ") + what + ": " + e.what() + ". " + STALE_SESSION_HINT);
        }
    }

    void SessionBootstrapper::bootstrap(Session& session, const CookieInputs& inputs) {
        http::cookie::CookieMap cookies = merge_inputs(inputs);

        std::string page;
        {
            const ScopedTransport bootstrap_transport(session.make_transport());

            try_rotate(session, *bootstrap_transport, cookies);

            http::model::Request landing;
            landing.url_ = gemini::protocol::Endpoint::GOOGLE;
            const http::model::Response landing_resp = fetch(*bootstrap_transport, landing, "the Google landing page");

            // Service-issued cookies only fill gaps; supplied values win.
            http::cookie::merge_under(cookies, http::cookie::cookies_from_response(landing_resp));

            http::model::Request app;
            app.url_ = gemini::protocol::Endpoint::INIT;
            app.headers_ = gemini::protocol::GEMINI_HEADERS;
            const std::string cookie = http::cookie::cookie_header(cookies);
            if (!cookie.empty()) {
                app.headers_.push_back(cookie);
            }
            page = fetch(*bootstrap_transport, app, "the Gemini app page").body_;
        }

        auto token = gemini::protocol::patterns::extract_access_token(page);
        if (!token) {
            throw gemini_error::TokenNotFound(std::string("Failed to locate Gemini access token on the app page. ") + STALE_SESSION_HINT);
        }

        session.install(session.make_transport(), std::move(*token), std::move(cookies));
        spdlog::debug("Session ready with {} cookies", session.cookies().size());
    }
}  // namespace gemini::session
