#ifndef GEMINI_WEB_CLIENT_CONFIG_HPP
#define GEMINI_WEB_CLIENT_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>

#include "../gemini/session/session.hpp"
#include "../gemini/session/session_bootstrapper.hpp"
#include "../http/cookie/cookie_map.hpp"

namespace config {
    struct EnvKeys {
        static constexpr const char* COOKIES_JSON = "ORACLE_GEMINI_COOKIES_JSON";
        static constexpr const char* SECURE_1PSID = "ORACLE_GEMINI_SECURE_1PSID";
        static constexpr const char* SECURE_1PSIDTS = "ORACLE_GEMINI_SECURE_1PSIDTS";
        static constexpr const char* PROXY = "ORACLE_GEMINI_PROXY";
        static constexpr const char* TIMEOUT_S = "ORACLE_GEMINI_TIMEOUT_S";
        static constexpr const char* AUTO_REFRESH = "ORACLE_GEMINI_AUTO_REFRESH";
        static constexpr const char* REFRESH_INTERVAL_S = "ORACLE_GEMINI_REFRESH_INTERVAL_S";
        static constexpr const char* VERIFY_TLS = "ORACLE_GEMINI_VERIFY_TLS";
    };

    // Returns the variable's value, or nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const char*)>;

    struct ClientConfig {
        gemini::session::CookieInputs cookies_;
        gemini::session::SessionOptions session_;

        [[nodiscard]] static ClientConfig from_environment();
        [[nodiscard]] static ClientConfig from_lookup(const EnvLookup& lookup);

        // JSON object of cookie name -> value. Nulls are dropped, other scalars stringified.
        // Returns nullopt for anything that is not a JSON object.
        [[nodiscard]] static std::optional<http::cookie::CookieMap> parse_cookie_json(const std::string& json);
    };
}  // namespace config

#endif
