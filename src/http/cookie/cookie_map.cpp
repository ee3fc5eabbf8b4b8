#include "cookie_map.hpp"

#include <string>

#include "../../utils/string_utils.hpp"

namespace http::cookie {
    void merge_over(CookieMap& base, const CookieMap& overrides) {
        for (const auto& [name, value] : overrides) {
            base[name] = value;
        }
    }

    void merge_under(CookieMap& base, const CookieMap& harvested) {
        for (const auto& [name, value] : harvested) {
            base.emplace(name, value);
        }
    }

    std::optional<std::pair<std::string, std::string>> parse_set_cookie(std::string_view header_value) {
        const auto attributes_start = header_value.find(';');
        const std::string_view pair = header_value.substr(0, attributes_start);

        const auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            return std::nullopt;
        }

        std::string name = string_utils::trim(std::string(pair.substr(0, eq)));
        if (name.empty()) {
            return std::nullopt;
        }

        std::string value = string_utils::trim(std::string(pair.substr(eq + 1)));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        return std::make_pair(std::move(name), std::move(value));
    }

    CookieMap cookies_from_response(const http::model::Response& resp) {
        CookieMap out;
        for (const auto& line : resp.set_cookies_) {
            if (auto parsed = parse_set_cookie(line)) {
                out[parsed->first] = std::move(parsed->second);
            }
        }
        return out;
    }

    std::string cookie_header(const CookieMap& cookies) {
        if (cookies.empty()) {
            return {};
        }

        std::string header = "Cookie: ";
        bool first = true;
        for (const auto& [name, value] : cookies) {
            if (!first) {
                header += "; ";
            }
            header += name;
            header += '=';
            header += value;
            first = false;
        }
        return header;
    }
}  // namespace http::cookie
