#ifndef GEMINI_WEB_SESSION_BOOTSTRAPPER_HPP
#define GEMINI_WEB_SESSION_BOOTSTRAPPER_HPP

#include <optional>
#include <string>

#include "../../http/cookie/cookie_map.hpp"
#include "session.hpp"

namespace gemini::session {
    struct CookieInputs {
        // Overrides every other source.
        std::optional<http::cookie::CookieMap> explicit_cookies_;

        // Legacy single-cookie inputs.
        std::optional<std::string> secure_1psid_;
        std::optional<std::string> secure_1psidts_;
    };

    inline constexpr const char* STALE_SESSION_HINT = "Make sure you're logged into gemini.google.com in your browser.";

    class SessionBootstrapper {
       public:
        // Named values first, then the explicit map on top.
        [[nodiscard]] static http::cookie::CookieMap merge_inputs(const CookieInputs& inputs);

        // Negotiates cookies and the access token, then installs the authenticated transport on `session`.
        // Throws BootstrapFailed on network failure and TokenNotFound when the app page has no token.
        static void bootstrap(Session& session, const CookieInputs& inputs);

       private:
        static void try_rotate(Session& session, http::client::IHttpClient& transport, http::cookie::CookieMap& cookies);
        static http::model::Response fetch(http::client::IHttpClient& transport, http::model::Request req, const char* what);
    };
}  // namespace gemini::session

#endif
