#ifndef GEMINI_WEB_ARTIFACT_RESOLVER_HPP
#define GEMINI_WEB_ARTIFACT_RESOLVER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "../dispatch/request_dispatcher.hpp"
#include "../dispatch/types.hpp"
#include "image_store.hpp"

namespace gemini::artifact {
    // Kept apart from the dispatcher's single default fallback model on purpose; the two policies are independent.
    inline const std::vector<std::string> DEFAULT_IMAGE_FALLBACK_MODELS = {"gemini-2.5-flash", "gemini-2.5-pro"};

    // Ordered, duplicate-free models to try when a reply promised an image but carried none.
    struct FallbackPlan {
        std::vector<std::string> models_;

        [[nodiscard]] static FallbackPlan of(const std::vector<std::string>& models);
    };

    enum class ResolutionTier { STRUCTURED, RAW_SCAN, PLACEHOLDER_RETRY, NONE };

    [[nodiscard]] const char* to_string(ResolutionTier tier);

    struct GeneratedArtifact {
        gemini::dispatch::ImageRef image_;
        std::filesystem::path path_;
    };

    struct ResolutionOutcome {
        std::optional<GeneratedArtifact> artifact_;
        ResolutionTier tier_ = ResolutionTier::NONE;

        // Images the winning tier found; only the first is saved.
        size_t image_count_ = 0;

        // Last envelope seen, which differs from the input after placeholder retries.
        gemini::dispatch::ResponseEnvelope envelope_;

        // Set when a placeholder retry re-dispatched with another model.
        std::optional<std::string> fallback_model_;

        [[nodiscard]] bool resolved() const { return artifact_.has_value(); }

        // Envelope text, or the empty-response marker.
        [[nodiscard]] std::string display_text() const;
    };

    class ArtifactResolver {
       public:
        ArtifactResolver(gemini::dispatch::IRequestDispatcher& dispatcher, IImageStore& store, FallbackPlan plan = FallbackPlan::of(DEFAULT_IMAGE_FALLBACK_MODELS));

        // Tiers run strictly in order: structured images, raw body scan, placeholder retry. The first to save wins.
        [[nodiscard]] ResolutionOutcome resolve(const gemini::dispatch::Request& request, gemini::dispatch::ResponseEnvelope envelope,
                                                const std::filesystem::path& destination);

       private:
        bool try_structured(ResolutionOutcome& outcome, const std::filesystem::path& destination, ResolutionTier tier);
        bool try_raw_scan(ResolutionOutcome& outcome, const std::filesystem::path& destination);
        bool try_placeholder_retry(const gemini::dispatch::Request& request, ResolutionOutcome& outcome, const std::filesystem::path& destination);

        gemini::dispatch::IRequestDispatcher& dispatcher_;
        IImageStore& store_;
        FallbackPlan plan_;
    };
}  // namespace gemini::artifact

#endif
