#ifndef GEMINI_WEB_COOKIE_MAP_HPP
#define GEMINI_WEB_COOKIE_MAP_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "../model/model.hpp"

namespace http::cookie {
    // Name -> value. Ordered only so the Cookie header is deterministic.
    using CookieMap = std::map<std::string, std::string>;

    // Every key of `overrides` replaces the same key in `base`.
    void merge_over(CookieMap& base, const CookieMap& overrides);

    // Keys of `harvested` are added only where `base` has none.
    void merge_under(CookieMap& base, const CookieMap& harvested);

    // Name and value of one Set-Cookie header value. Attributes are ignored.
    [[nodiscard]] std::optional<std::pair<std::string, std::string>> parse_set_cookie(std::string_view header_value);

    // Later Set-Cookie lines win over earlier ones for the same name.
    [[nodiscard]] CookieMap cookies_from_response(const http::model::Response& resp);

    // "Cookie: a=1; b=2", or an empty string for an empty map.
    [[nodiscard]] std::string cookie_header(const CookieMap& cookies);
}  // namespace http::cookie

#endif
