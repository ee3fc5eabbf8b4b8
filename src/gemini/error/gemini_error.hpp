#ifndef GEMINI_WEB_GEMINI_ERROR_HPP
#define GEMINI_WEB_GEMINI_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gemini::gemini_error {
    enum class ErrorCategory {
        BOOTSTRAP_FAILED,
        TOKEN_NOT_FOUND,
        MODEL_INVALID,
        DISPATCH_FAILED,
        FEATURE_UNAVAILABLE_FOR_ACCOUNT,
        NO_ARTIFACT_RESOLVED,
        UNCLASSIFIED,
    };

    [[nodiscard]] const char* to_string(ErrorCategory category);

    struct GeminiError : public std::runtime_error {
        ErrorCategory category_;
        explicit GeminiError(ErrorCategory category, const std::string& msg);
    };

    // Network or transport failure while setting up the session.
    struct BootstrapFailed : public GeminiError {
        explicit BootstrapFailed(const std::string& msg);
    };

    // The app page carried none of the known access token keys.
    struct TokenNotFound : public GeminiError {
        explicit TokenNotFound(const std::string& msg);
    };

    struct ModelInvalid : public GeminiError {
        std::string model_;
        explicit ModelInvalid(std::string model, const std::string& msg);
    };

    // Any other generation failure. Carries the last captured StreamGenerate body, if any.
    struct DispatchFailed : public GeminiError {
        std::string raw_body_;
        explicit DispatchFailed(const std::string& msg, std::string raw_body = {}, ErrorCategory category = ErrorCategory::DISPATCH_FAILED);
    };
}  // namespace gemini::gemini_error

#endif
