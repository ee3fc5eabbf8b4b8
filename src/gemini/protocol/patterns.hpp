#ifndef GEMINI_WEB_PROTOCOL_PATTERNS_HPP
#define GEMINI_WEB_PROTOCOL_PATTERNS_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Everything that depends on the shape of the service's pages and payload text lives here.
namespace gemini::protocol::patterns {
    // Tried in this order; the first key present in the page wins.
    inline constexpr std::array<const char*, 2> ACCESS_TOKEN_KEYS = {"SNlM0e", "thykhd"};

    inline constexpr const char* MALFORMED_PAYLOAD_MARKER = "af.httprm";
    inline constexpr const char* INVALID_RESPONSE_MESSAGE = "Invalid response data received";

    [[nodiscard]] std::optional<std::string> extract_access_token(std::string_view page);

    // Image CDN URLs found in a raw generation body, first-seen order, without duplicates.
    [[nodiscard]] std::vector<std::string> extract_image_urls(std::string_view raw_body);

    // True when the text carries the "image is coming" placeholder instead of an image.
    [[nodiscard]] bool has_image_placeholder(std::string_view text);

    [[nodiscard]] bool is_card_content(std::string_view text);
}  // namespace gemini::protocol::patterns

#endif
