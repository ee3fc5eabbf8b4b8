#include "error_classifier.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "../../utils/string_utils.hpp"
#include "../protocol/patterns.hpp"

namespace gemini::gemini_error {
    Classification ErrorClassifier::classify(std::string_view failure_message, std::string_view last_raw_body) {
        namespace patterns = gemini::protocol::patterns;

        Classification out;
        out.message_ = std::string(failure_message);

        if (string_utils::contains(failure_message, patterns::INVALID_RESPONSE_MESSAGE) &&
            string_utils::contains(last_raw_body, patterns::MALFORMED_PAYLOAD_MARKER)) {
            out.category_ = ErrorCategory::FEATURE_UNAVAILABLE_FOR_ACCOUNT;
            out.guidance_ = FEATURE_UNAVAILABLE_GUIDANCE;
        }

        return out;
    }

    void ErrorClassifier::rethrow_enriched(const DispatchFailed& e) {
        const Classification c = classify(e.what(), e.raw_body_);

        if (!c.guidance_) {
            throw e;
        }

        spdlog::warn("{}", *c.guidance_);
        throw DispatchFailed(c.message_ + "\n" + *c.guidance_, e.raw_body_, c.category_);
    }
}  // namespace gemini::gemini_error
