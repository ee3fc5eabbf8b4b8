#include "client_config.hpp"

#include <simdjson.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "../gemini/protocol/constants.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

namespace config {
    namespace {
        std::optional<std::string> non_empty(const EnvLookup& lookup, const char* key) {
            auto value = lookup(key);
            if (!value || value->empty()) {
                return std::nullopt;
            }
            return value;
        }

        long parse_positive_long(const EnvLookup& lookup, const char* key, long fallback) {
            auto raw = non_empty(lookup, key);
            if (!raw) {
                return fallback;
            }

            char* end = nullptr;
            const long value = std::strtol(raw->c_str(), &end, constants::BASE_10);
            if (end == raw->c_str() || *end != '\0' || value <= 0) {
                spdlog::warn("Ignoring {}={}: expected a positive integer", key, *raw);
                return fallback;
            }
            return value;
        }

        bool parse_flag(const EnvLookup& lookup, const char* key, bool fallback) {
            auto raw = non_empty(lookup, key);
            if (!raw) {
                return fallback;
            }

            std::string value = string_utils::trim(*raw);
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
            if (value == "1" || value == "true" || value == "yes" || value == "on") {
                return true;
            }
            if (value == "0" || value == "false" || value == "no" || value == "off") {
                return false;
            }

            spdlog::warn("Ignoring {}={}: expected a boolean", key, *raw);
            return fallback;
        }
    }  // namespace

    std::optional<http::cookie::CookieMap> ClientConfig::parse_cookie_json(const std::string& json) {
        try {
            simdjson::ondemand::parser parser;
            simdjson::padded_string padded(json);
            simdjson::ondemand::document doc = parser.iterate(padded);

            simdjson::ondemand::object object;
            if (doc.get_object().get(object) != simdjson::SUCCESS) {
                spdlog::warn("Ignoring {}: expected a JSON object", EnvKeys::COOKIES_JSON);
                return std::nullopt;
            }

            http::cookie::CookieMap cookies;
            for (auto field : object) {
                std::string key(field.unescaped_key().value());
                simdjson::ondemand::value value = field.value();

                switch (value.type().value()) {
                    case simdjson::ondemand::json_type::null:
                        break;
                    case simdjson::ondemand::json_type::string:
                        cookies[key] = std::string(value.get_string().value());
                        break;
                    default:
                        cookies[key] = std::string(simdjson::to_json_string(value).value());
                        break;
                }
            }
            return cookies;
        } catch (const simdjson::simdjson_error& e) {
            spdlog::warn("Ignoring malformed {}: {}", EnvKeys::COOKIES_JSON, e.what());
            return std::nullopt;
        }
    }

    ClientConfig ClientConfig::from_lookup(const EnvLookup& lookup) {
        ClientConfig config;

        if (auto raw = non_empty(lookup, EnvKeys::COOKIES_JSON)) {
            config.cookies_.explicit_cookies_ = parse_cookie_json(*raw);
        }

        // Legacy keys only fill in what the JSON map does not carry.
        auto from_map = [&config](const char* name) -> std::optional<std::string> {
            if (!config.cookies_.explicit_cookies_) {
                return std::nullopt;
            }
            const auto it = config.cookies_.explicit_cookies_->find(name);
            if (it == config.cookies_.explicit_cookies_->end() || it->second.empty()) {
                return std::nullopt;
            }
            return it->second;
        };

        config.cookies_.secure_1psid_ = from_map(gemini::protocol::CookieNames::SECURE_1PSID);
        if (!config.cookies_.secure_1psid_) {
            config.cookies_.secure_1psid_ = non_empty(lookup, EnvKeys::SECURE_1PSID);
        }
        config.cookies_.secure_1psidts_ = from_map(gemini::protocol::CookieNames::SECURE_1PSIDTS);
        if (!config.cookies_.secure_1psidts_) {
            config.cookies_.secure_1psidts_ = non_empty(lookup, EnvKeys::SECURE_1PSIDTS);
        }

        config.session_.proxy_ = non_empty(lookup, EnvKeys::PROXY).value_or("");
        config.session_.timeout_s_ = parse_positive_long(lookup, EnvKeys::TIMEOUT_S, constants::DEFAULT_TIMEOUT_S);
        config.session_.auto_refresh_ = parse_flag(lookup, EnvKeys::AUTO_REFRESH, true);
        config.session_.refresh_interval_s_ = parse_positive_long(lookup, EnvKeys::REFRESH_INTERVAL_S, constants::DEFAULT_REFRESH_INTERVAL_S);
        config.session_.verify_tls_ = parse_flag(lookup, EnvKeys::VERIFY_TLS, true);

        return config;
    }

    ClientConfig ClientConfig::from_environment() {
        return from_lookup([](const char* key) -> std::optional<std::string> {
            const char* value = std::getenv(key);
            if (value == nullptr) {
                return std::nullopt;
            }
            return std::string(value);
        });
    }
}  // namespace config
