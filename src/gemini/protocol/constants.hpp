#ifndef GEMINI_WEB_PROTOCOL_CONSTANTS_HPP
#define GEMINI_WEB_PROTOCOL_CONSTANTS_HPP

#include <array>
#include <string>
#include <vector>

namespace gemini::protocol {
    struct Endpoint {
        static constexpr const char* GOOGLE = "https://www.google.com";
        static constexpr const char* INIT = "https://gemini.google.com/app";
        static constexpr const char* GENERATE =
            "https://gemini.google.com/_/BardChatUi/data/assistant.lamda.BardFrontendService/StreamGenerate";
        static constexpr const char* ROTATE_COOKIES = "https://accounts.google.com/RotateCookies";
        static constexpr const char* UPLOAD = "https://content-push.googleapis.com/upload";

        // Substring identifying generation calls for raw body capture.
        static constexpr const char* GENERATE_MARKER = "StreamGenerate";
    };

    struct CookieNames {
        static constexpr const char* SECURE_1PSID = "__Secure-1PSID";
        static constexpr const char* SECURE_1PSIDTS = "__Secure-1PSIDTS";
    };

    inline const std::vector<std::string> GEMINI_HEADERS = {
        "Content-Type: application/x-www-form-urlencoded;charset=utf-8",
        "Host: gemini.google.com",
        "Origin: https://gemini.google.com",
        "Referer: https://gemini.google.com/",
        "X-Same-Domain: 1",
    };

    inline const std::vector<std::string> ROTATE_COOKIES_HEADERS = {"Content-Type: application/json"};

    inline const std::vector<std::string> UPLOAD_HEADERS = {"Push-ID: feeds/mcudyrk2a4khkz"};

    inline constexpr const char* ROTATE_COOKIES_BODY = R"([000,"-0000000000000000000"])";

    // Appended to generated image URLs to fetch the full-size rendition.
    inline constexpr const char* FULL_SIZE_SUFFIX = "=s2048";

    enum class ServiceErrorCode : long {
        TEMPORARY_ERROR = 1013,
        USAGE_LIMIT_EXCEEDED = 1037,
        MODEL_INCONSISTENT = 1050,
        MODEL_HEADER_INVALID = 1052,
        IP_TEMPORARILY_BLOCKED = 1060,
    };

    struct ModelSpec {
        const char* name_;
        const char* header_value_;  // nullptr => no model header
    };

    inline constexpr const char* MODEL_HEADER_NAME = "x-goog-ext-525001261-jspb";

    inline constexpr std::array<ModelSpec, 4> MODELS = {{
        {"unspecified", nullptr},
        {"gemini-2.5-flash", R"([1,null,null,null,"71c2d248d3b102ff",null,null,0,[4]])"},
        {"gemini-2.5-pro", R"([1,null,null,null,"4af6c7f5da75d65d",null,null,0,[4]])"},
        {"gemini-3.0-pro", R"([1,null,null,null,"9d8ca3786ebdfbea",null,null,0,[4]])"},
    }};

    // Headers selecting `model_name`. Throws ModelInvalid for names the service does not know.
    [[nodiscard]] std::vector<std::string> model_headers(const std::string& model_name);

    [[nodiscard]] bool is_known_model(const std::string& model_name);
}  // namespace gemini::protocol

#endif
