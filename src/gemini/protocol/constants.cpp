#include "constants.hpp"

#include <algorithm>

#include "../error/gemini_error.hpp"

namespace gemini::protocol {
    namespace {
        const ModelSpec* find_model(const std::string& model_name) {
            const auto* it = std::find_if(MODELS.begin(), MODELS.end(), [&](const ModelSpec& spec) { return model_name == spec.name_; });
            return it == MODELS.end() ? nullptr : it;
        }
    }  // namespace

    bool is_known_model(const std::string& model_name) { return find_model(model_name) != nullptr; }

    std::vector<std::string> model_headers(const std::string& model_name) {
        const ModelSpec* spec = find_model(model_name);
        if (spec == nullptr) {
            throw gemini_error::ModelInvalid(model_name, "Unknown model name: " + model_name);
        }

        if (spec->header_value_ == nullptr) {
            return {};
        }
        return {std::string(MODEL_HEADER_NAME) + ": " + spec->header_value_};
    }
}  // namespace gemini::protocol
