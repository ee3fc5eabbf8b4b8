#include "response_parser.hpp"

#include <simdjson.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../error/gemini_error.hpp"
#include "constants.hpp"
#include "patterns.hpp"

namespace gemini::protocol {
    namespace {
        using simdjson::dom::element;

        std::optional<std::string> string_at(const element& root, std::string_view pointer) {
            std::string_view sv;
            if (root.at_pointer(pointer).get_string().get(sv) != simdjson::SUCCESS) {
                return std::nullopt;
            }
            return std::string(sv);
        }

        // Scalar at `pointer` rendered as text, whether the service sent a number or a string.
        std::optional<std::string> scalar_at(const element& root, std::string_view pointer) {
            int64_t number = 0;
            if (root.at_pointer(pointer).get_int64().get(number) == simdjson::SUCCESS) {
                return std::to_string(number);
            }
            return string_at(root, pointer);
        }

        std::optional<simdjson::dom::array> array_at(const element& root, std::string_view pointer) {
            simdjson::dom::array arr;
            if (root.at_pointer(pointer).get_array().get(arr) != simdjson::SUCCESS || arr.size() == 0) {
                return std::nullopt;
            }
            return arr;
        }

        std::vector<gemini::dispatch::ImageRef> web_images(const element& candidate) {
            std::vector<gemini::dispatch::ImageRef> out;
            auto images = array_at(candidate, "/12/1");
            if (!images) {
                return out;
            }

            for (element image : *images) {
                auto url = string_at(image, "/0/0/0");
                if (!url) {
                    continue;
                }
                out.push_back(gemini::dispatch::ImageRef{
                    .url_ = std::move(*url),
                    .title_ = string_at(image, "/7/0").value_or(""),
                    .alt_ = string_at(image, "/0/4").value_or(""),
                    .generated_ = false,
                });
            }
            return out;
        }

        std::vector<gemini::dispatch::ImageRef> generated_images(const element& candidate) {
            std::vector<gemini::dispatch::ImageRef> out;
            auto images = array_at(candidate, "/12/7/0");
            if (!images) {
                return out;
            }

            for (element image : *images) {
                auto url = string_at(image, "/0/3/3");
                if (!url) {
                    continue;
                }
                out.push_back(gemini::dispatch::ImageRef{
                    .url_ = std::move(*url),
                    .title_ = "[Generated Image " + scalar_at(image, "/3/6").value_or("0") + "]",
                    .alt_ = string_at(image, "/3/5/0").value_or(""),
                    .generated_ = true,
                });
            }
            return out;
        }

        gemini::dispatch::ResponseEnvelope envelope_from(const element& body, const element& candidate) {
            gemini::dispatch::ResponseEnvelope envelope;

            envelope.text_ = string_at(candidate, "/1/0").value_or("");
            if (patterns::is_card_content(envelope.text_)) {
                envelope.text_ = string_at(candidate, "/22/0").value_or(envelope.text_);
            }
            envelope.thoughts_ = string_at(candidate, "/37/0/0");

            envelope.metadata_.cid_ = string_at(body, "/1/0").value_or("");
            envelope.metadata_.rid_ = string_at(body, "/1/1").value_or("");
            envelope.metadata_.rcid_ = string_at(candidate, "/0").value_or("");

            envelope.images_ = web_images(candidate);
            return envelope;
        }

        [[noreturn]] void throw_for_error_code(std::optional<int64_t> code, const std::string& model, const std::string& body) {
            const std::string invalid = std::string("Failed to generate contents. ") + patterns::INVALID_RESPONSE_MESSAGE + ".";

            if (!code) {
                throw gemini_error::DispatchFailed(invalid, body);
            }

            switch (static_cast<ServiceErrorCode>(*code)) {
                case ServiceErrorCode::MODEL_INCONSISTENT:
                case ServiceErrorCode::MODEL_HEADER_INVALID:
                    throw gemini_error::ModelInvalid(model, "Model " + model + " is not available for this account (error " + std::to_string(*code) + ")");
                case ServiceErrorCode::USAGE_LIMIT_EXCEEDED:
                    throw gemini_error::DispatchFailed("Usage limit of " + model + " has been exceeded. Try again later.", body);
                case ServiceErrorCode::IP_TEMPORARILY_BLOCKED:
                    throw gemini_error::DispatchFailed("Requests from this IP are temporarily blocked. Try again later or use a proxy.", body);
                case ServiceErrorCode::TEMPORARY_ERROR:
                    throw gemini_error::DispatchFailed("Gemini reported a temporary error. Try again later.", body);
            }
            throw gemini_error::DispatchFailed(invalid + " (error " + std::to_string(*code) + ")", body);
        }
    }  // namespace

    gemini::dispatch::ResponseEnvelope ResponseParser::parse(const std::string& body, const std::string& model) {
        std::vector<std::string> payloads;
        std::optional<int64_t> error_code;

        simdjson::dom::parser line_parser;
        for (std::string_view line : string_utils::split_lines(body)) {
            if (line.empty() || line.front() != '[') {
                continue;
            }

            element doc;
            if (line_parser.parse(line.data(), line.size()).get(doc) != simdjson::SUCCESS) {
                continue;
            }

            simdjson::dom::array parts;
            if (doc.get_array().get(parts) != simdjson::SUCCESS) {
                continue;
            }

            for (element part : parts) {
                int64_t code = 0;
                if (!error_code && part.at_pointer("/5/2/0/1/0").get_int64().get(code) == simdjson::SUCCESS) {
                    error_code = code;
                }

                if (auto payload = string_at(part, "/2")) {
                    payloads.push_back(std::move(*payload));
                }
            }
        }

        std::optional<gemini::dispatch::ResponseEnvelope> envelope;
        std::vector<gemini::dispatch::ImageRef> generated;

        // Generated images may arrive in a later part than the text; keep scanning until found.
        simdjson::dom::parser payload_parser;
        for (const auto& payload : payloads) {
            element inner;
            if (payload_parser.parse(payload).get(inner) != simdjson::SUCCESS) {
                continue;
            }

            element candidate;
            if (!array_at(inner, "/4") || inner.at_pointer("/4/0").get(candidate) != simdjson::SUCCESS) {
                continue;
            }

            if (!envelope) {
                envelope = envelope_from(inner, candidate);
            }

            if (generated.empty()) {
                generated = generated_images(candidate);
            }

            if (!generated.empty()) {
                break;
            }
        }

        if (!envelope) {
            throw_for_error_code(error_code, model, body);
        }

        envelope->images_.insert(envelope->images_.end(), generated.begin(), generated.end());
        return std::move(*envelope);
    }
}  // namespace gemini::protocol
