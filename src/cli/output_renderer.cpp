#include "output_renderer.hpp"

#include <json/json.h>

#include <string>

#include "../utils/constants.hpp"

namespace cli {
    namespace {
        std::string to_pretty_json(const Json::Value& value) {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "  ";
            builder["enableYAMLCompatibility"] = true;
            return Json::writeString(builder, value);
        }

        Json::Value summary(const std::string& text, const Json::Value& thoughts, size_t image_count) {
            Json::Value output(Json::objectValue);
            output["text"] = text;
            output["thoughts"] = thoughts;
            output["has_images"] = image_count > 0;
            output["image_count"] = static_cast<Json::UInt64>(image_count);
            return output;
        }
    }  // namespace

    OutputRenderer::OutputRenderer(std::ostream& out, std::ostream& err, RenderOptions options) : out_(out), err_(err), options_(options) {}

    void OutputRenderer::render_text(const gemini::dispatch::ResponseEnvelope& envelope) const {
        const bool has_thoughts = envelope.thoughts_.has_value() && !envelope.thoughts_->empty();

        if (options_.json_output_) {
            const Json::Value thoughts = options_.show_thoughts_ && envelope.thoughts_ ? Json::Value(*envelope.thoughts_) : Json::Value();
            out_ << to_pretty_json(summary(envelope.text_, thoughts, envelope.images_.size())) << '\n';
            return;
        }

        if (options_.show_thoughts_ && has_thoughts) {
            out_ << "=== Thinking ===\n" << *envelope.thoughts_ << "\n\n=== Response ===\n";
        }
        out_ << (envelope.text_.empty() ? constants::EMPTY_RESPONSE : envelope.text_) << '\n';
    }

    void OutputRenderer::render_image(const gemini::artifact::ResolutionOutcome& outcome) const {
        const std::string path = outcome.artifact_ ? outcome.artifact_->path_.string() : std::string();

        if (outcome.image_count_ > 1) {
            err_ << "(" << outcome.image_count_ << " images generated, saved first one)\n";
        }
        if (outcome.fallback_model_) {
            err_ << "(Used fallback image model: " << *outcome.fallback_model_ << ")\n";
        }

        if (options_.json_output_) {
            out_ << to_pretty_json(summary("Saved: " + path, Json::Value(), outcome.image_count_)) << '\n';
            return;
        }

        out_ << "Saved: " << path << '\n';
        if (!outcome.envelope_.text_.empty()) {
            out_ << "\nResponse: " << outcome.envelope_.text_ << '\n';
        }
    }

    void OutputRenderer::render_unresolved(const gemini::artifact::ResolutionOutcome& outcome) const {
        err_ << "No images generated. Response text:\n";
        out_ << outcome.display_text() << '\n';
    }
}  // namespace cli
