#include "gemini_error.hpp"

#include <string>

namespace gemini::gemini_error {
    const char* to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::BOOTSTRAP_FAILED:
                return "BootstrapFailed";
            case ErrorCategory::TOKEN_NOT_FOUND:
                return "TokenNotFound";
            case ErrorCategory::MODEL_INVALID:
                return "ModelInvalid";
            case ErrorCategory::DISPATCH_FAILED:
                return "DispatchFailed";
            case ErrorCategory::FEATURE_UNAVAILABLE_FOR_ACCOUNT:
                return "FeatureUnavailableForAccount";
            case ErrorCategory::NO_ARTIFACT_RESOLVED:
                return "NoArtifactResolved";
            case ErrorCategory::UNCLASSIFIED:
                return "Unclassified";
        }
        return "Unclassified";
    }

    GeminiError::GeminiError(ErrorCategory category, const std::string& msg) : std::runtime_error(msg), category_(category) {}

    BootstrapFailed::BootstrapFailed(const std::string& msg) : GeminiError(ErrorCategory::BOOTSTRAP_FAILED, msg) {}

    TokenNotFound::TokenNotFound(const std::string& msg) : GeminiError(ErrorCategory::TOKEN_NOT_FOUND, msg) {}

    ModelInvalid::ModelInvalid(std::string model, const std::string& msg) : GeminiError(ErrorCategory::MODEL_INVALID, msg), model_(std::move(model)) {}

    DispatchFailed::DispatchFailed(const std::string& msg, std::string raw_body, ErrorCategory category)
        : GeminiError(category, msg), raw_body_(std::move(raw_body)) {}
}  // namespace gemini::gemini_error
