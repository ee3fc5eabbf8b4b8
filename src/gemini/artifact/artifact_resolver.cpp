#include "artifact_resolver.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

#include "../../utils/constants.hpp"
#include "../protocol/patterns.hpp"

namespace gemini::artifact {
    FallbackPlan FallbackPlan::of(const std::vector<std::string>& models) {
        FallbackPlan plan;
        std::unordered_set<std::string> seen;
        for (const auto& model : models) {
            if (seen.insert(model).second) {
                plan.models_.push_back(model);
            }
        }
        return plan;
    }

    const char* to_string(ResolutionTier tier) {
        switch (tier) {
            case ResolutionTier::STRUCTURED:
                return "structured";
            case ResolutionTier::RAW_SCAN:
                return "raw-scan";
            case ResolutionTier::PLACEHOLDER_RETRY:
                return "placeholder-retry";
            case ResolutionTier::NONE:
                return "none";
        }
        return "none";
    }

    std::string ResolutionOutcome::display_text() const { return envelope_.text_.empty() ? constants::EMPTY_RESPONSE : envelope_.text_; }

    ArtifactResolver::ArtifactResolver(gemini::dispatch::IRequestDispatcher& dispatcher, IImageStore& store, FallbackPlan plan)
        : dispatcher_(dispatcher), store_(store), plan_(std::move(plan)) {}

    ResolutionOutcome ArtifactResolver::resolve(const gemini::dispatch::Request& request, gemini::dispatch::ResponseEnvelope envelope,
                                                const std::filesystem::path& destination) {
        ResolutionOutcome outcome;
        outcome.envelope_ = std::move(envelope);

        if (try_structured(outcome, destination, ResolutionTier::STRUCTURED)) {
            return outcome;
        }
        if (try_raw_scan(outcome, destination)) {
            return outcome;
        }
        if (try_placeholder_retry(request, outcome, destination)) {
            return outcome;
        }

        spdlog::debug("No image resolved by any tier");
        return outcome;
    }

    bool ArtifactResolver::try_structured(ResolutionOutcome& outcome, const std::filesystem::path& destination, ResolutionTier tier) {
        const auto& images = outcome.envelope_.images_;
        if (images.empty()) {
            return false;
        }

        store_.save(images.front(), destination);

        outcome.artifact_ = GeneratedArtifact{.image_ = images.front(), .path_ = destination};
        outcome.tier_ = tier;
        outcome.image_count_ = images.size();
        return true;
    }

    bool ArtifactResolver::try_raw_scan(ResolutionOutcome& outcome, const std::filesystem::path& destination) {
        const std::vector<std::string> urls = gemini::protocol::patterns::extract_image_urls(outcome.envelope_.raw_body_);
        if (urls.empty()) {
            return false;
        }

        const gemini::dispatch::ImageRef image{.url_ = urls.front(), .title_ = "", .alt_ = "", .generated_ = true};
        try {
            store_.save(image, destination);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to download Gemini-generated image (will retry with fallback models): {}", e.what());
            return false;
        }

        outcome.artifact_ = GeneratedArtifact{.image_ = image, .path_ = destination};
        outcome.tier_ = ResolutionTier::RAW_SCAN;
        outcome.image_count_ = urls.size();
        return true;
    }

    bool ArtifactResolver::try_placeholder_retry(const gemini::dispatch::Request& request, ResolutionOutcome& outcome,
                                                 const std::filesystem::path& destination) {
        if (!gemini::protocol::patterns::has_image_placeholder(outcome.envelope_.text_)) {
            return false;
        }

        std::string tried = outcome.envelope_.model_.empty() ? request.model_ : outcome.envelope_.model_;
        for (const auto& model : plan_.models_) {
            if (model == tried) {
                continue;
            }

            spdlog::info("Retrying image generation with {}...", model);
            outcome.envelope_ = dispatcher_.dispatch_once(request.with_model(model));
            outcome.fallback_model_ = model;
            tried = model;

            if (!outcome.envelope_.images_.empty()) {
                break;
            }
        }

        return try_structured(outcome, destination, ResolutionTier::PLACEHOLDER_RETRY);
    }
}  // namespace gemini::artifact
