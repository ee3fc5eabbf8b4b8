#include "cookie_rotator.hpp"

#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../protocol/constants.hpp"

namespace gemini::session {
    bool CookieRotator::can_rotate(const http::cookie::CookieMap& cookies) {
        return cookies.contains(gemini::protocol::CookieNames::SECURE_1PSID) && cookies.contains(gemini::protocol::CookieNames::SECURE_1PSIDTS);
    }

    std::optional<std::string> CookieRotator::rotate(http::client::IHttpClient& transport, const http::cookie::CookieMap& cookies) {
        http::model::Request req;
        req.url_ = gemini::protocol::Endpoint::ROTATE_COOKIES;
        req.method_ = "POST";
        req.headers_ = gemini::protocol::ROTATE_COOKIES_HEADERS;
        req.body_ = gemini::protocol::ROTATE_COOKIES_BODY;

        const std::string cookie = http::cookie::cookie_header(cookies);
        if (!cookie.empty()) {
            req.headers_.push_back(cookie);
        }

        const http::model::Response resp = transport.post(req);

        if (resp.status_ == constants::HTTP_UNAUTHORIZED) {
            throw http::http_error::HttpError::from_response(resp, req.url_, "Cookie rotation (unauthorized)");
        }
        if (!http::http_error::is_success(resp)) {
            throw http::http_error::HttpError::from_response(resp, req.url_, "Cookie rotation");
        }

        const auto issued = http::cookie::cookies_from_response(resp);
        const auto it = issued.find(gemini::protocol::CookieNames::SECURE_1PSIDTS);
        if (it == issued.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }
}  // namespace gemini::session
