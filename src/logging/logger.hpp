#ifndef GEMINI_WEB_LOGGER_HPP
#define GEMINI_WEB_LOGGER_HPP

namespace logging {
    inline constexpr const char* LOGGER_NAME = "gemini-web";
    inline constexpr const char* LOG_PATTERN = "[%^%l%$] %v";

    // Installs the default logger on stderr. SPDLOG_LEVEL from the environment overrides `verbose`.
    void init(bool verbose);
}  // namespace logging

#endif
