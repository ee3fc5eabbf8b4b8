#ifndef GEMINI_WEB_CONSTANTS_HPP
#define GEMINI_WEB_CONSTANTS_HPP

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long DEFAULT_TIMEOUT_S = 120;
    inline constexpr long DEFAULT_REFRESH_INTERVAL_S = 540;
    inline constexpr long HTTP_OK = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr long HTTP_UNAUTHORIZED = 401;
    inline constexpr const char* DEFAULT_MODEL = "gemini-3.0-pro";
    inline constexpr const char* DEFAULT_OUTPUT_FILE = "generated.png";
    inline constexpr const char* EMPTY_RESPONSE = "(empty response)";
}  // namespace constants

#endif
