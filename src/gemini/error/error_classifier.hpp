#ifndef GEMINI_WEB_ERROR_CLASSIFIER_HPP
#define GEMINI_WEB_ERROR_CLASSIFIER_HPP

#include <optional>
#include <string>
#include <string_view>

#include "gemini_error.hpp"

namespace gemini::gemini_error {
    struct Classification {
        ErrorCategory category_ = ErrorCategory::UNCLASSIFIED;
        std::string message_;
        std::optional<std::string> guidance_;
    };

    inline constexpr const char* FEATURE_UNAVAILABLE_GUIDANCE =
        "Gemini returned an unexpected response for this request. This often happens when file/image features "
        "aren't enabled for the current Gemini account/region (or the web endpoint changed).";

    class ErrorClassifier {
       public:
        // Maps a failure message and the last captured raw body to a category. Never changes the message of an
        // unclassified failure.
        [[nodiscard]] static Classification classify(std::string_view failure_message, std::string_view last_raw_body);

        // Rethrows `e` with the classification applied. Always throws.
        [[noreturn]] static void rethrow_enriched(const DispatchFailed& e);
    };
}  // namespace gemini::gemini_error

#endif
