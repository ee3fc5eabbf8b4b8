#ifndef GEMINI_WEB_COOKIE_ROTATOR_HPP
#define GEMINI_WEB_COOKIE_ROTATOR_HPP

#include <optional>
#include <string>

#include "../../http/client/interface.hpp"
#include "../../http/cookie/cookie_map.hpp"

namespace gemini::session {
    class CookieRotator {
       public:
        // Asks the accounts service for a fresh __Secure-1PSIDTS. Returns nullopt when none was issued.
        // Throws HttpError on 401 or any other non-2xx status.
        [[nodiscard]] static std::optional<std::string> rotate(http::client::IHttpClient& transport, const http::cookie::CookieMap& cookies);

        [[nodiscard]] static bool can_rotate(const http::cookie::CookieMap& cookies);
    };
}  // namespace gemini::session

#endif
