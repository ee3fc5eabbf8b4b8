#include "patterns.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace gemini::protocol::patterns {
    namespace {
        constexpr std::string_view IMAGE_URL_PREFIX = "https://lh3.googleusercontent.com/gg-dl/";

        // Backslash included: the body is JSON nested in JSON, so URLs end at an escaped quote.
        bool ends_image_url(char c) {
            switch (c) {
                case ' ':
                case '\t':
                case '\n':
                case '\r':
                case '\f':
                case '\v':
                case '"':
                case '\'':
                case '\\':
                    return true;
                default:
                    return false;
            }
        }

        const std::regex& image_placeholder_regex() {
            static const std::regex re(R"(http://googleusercontent\.com/image_generation_content/\d+)");
            return re;
        }

        const std::regex& card_content_regex() {
            static const std::regex re(R"(^http://googleusercontent\.com/card_content/\d+)");
            return re;
        }
    }  // namespace

    std::optional<std::string> extract_access_token(std::string_view page) {
        const std::string haystack(page);

        for (const char* key : ACCESS_TOKEN_KEYS) {
            const std::regex re(std::string("\"") + key + R"re(":"(.*?)")re");
            std::smatch match;
            if (std::regex_search(haystack, match, re)) {
                return match[1].str();
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> extract_image_urls(std::string_view raw_body) {
        std::vector<std::string> urls;
        std::unordered_set<std::string> seen;

        size_t pos = raw_body.find(IMAGE_URL_PREFIX);
        while (pos != std::string_view::npos) {
            size_t end = pos + IMAGE_URL_PREFIX.size();
            while (end < raw_body.size() && !ends_image_url(raw_body[end])) {
                ++end;
            }

            if (end > pos + IMAGE_URL_PREFIX.size()) {
                std::string url(raw_body.substr(pos, end - pos));
                if (seen.insert(url).second) {
                    urls.push_back(std::move(url));
                }
            }
            pos = raw_body.find(IMAGE_URL_PREFIX, end);
        }
        return urls;
    }

    bool has_image_placeholder(std::string_view text) {
        if (text.empty()) {
            return false;
        }
        return std::regex_search(text.begin(), text.end(), image_placeholder_regex());
    }

    bool is_card_content(std::string_view text) { return std::regex_search(text.begin(), text.end(), card_content_regex()); }
}  // namespace gemini::protocol::patterns
