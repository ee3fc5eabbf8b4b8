#include "request_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "../../http/error/http_error.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/error_classifier.hpp"
#include "../error/gemini_error.hpp"
#include "../protocol/constants.hpp"
#include "../protocol/payload.hpp"
#include "../protocol/response_parser.hpp"

namespace gemini::dispatch {
    std::string edit_prompt(const std::string& prompt) { return "Use image generation tool to " + prompt; }

    void ResponseCapture::observe(const http::model::Request& req, const http::model::Response& resp) {
        if (string_utils::contains(req.url_, gemini::protocol::Endpoint::GENERATE_MARKER)) {
            body_ = resp.body_;
        }
    }

    RequestDispatcher::RequestDispatcher(gemini::session::Session& session, DispatcherOptions options)
        : session_(session), options_(std::move(options)) {}

    ResponseEnvelope RequestDispatcher::dispatch(const Request& request) {
        spdlog::info("Querying {}...", request.model_);

        try {
            return dispatch_once(request);
        } catch (const gemini_error::ModelInvalid& e) {
            if (request.model_ == options_.default_fallback_model_) {
                throw;
            }
            spdlog::warn("Model {} is not available; retrying with {}...", request.model_, options_.default_fallback_model_);
            spdlog::debug("{}", e.what());
        }

        return dispatch_once(request.with_model(options_.default_fallback_model_));
    }

    ResponseEnvelope RequestDispatcher::dispatch_once(const Request& request) {
        const std::vector<std::string> model_headers = gemini::protocol::model_headers(request.model_);

        session_.refresh_if_due();

        ResponseCapture capture;
        try {
            switch (request.shape()) {
                case RequestShape::PLAIN:
                    return send(request.prompt_, {}, {}, request.model_, model_headers, capture);
                case RequestShape::ATTACHMENT:
                    return send(request.prompt_, upload_all(request.attachments_), {}, request.model_, model_headers, capture);
                case RequestShape::EDIT: {
                    const ResponseEnvelope base = send(EDIT_INTRO_PROMPT, {upload(*request.edit_base_)}, {}, request.model_, model_headers, capture);
                    return send(edit_prompt(request.prompt_), {}, base.metadata_, request.model_, model_headers, capture);
                }
            }
        } catch (const gemini_error::DispatchFailed& e) {
            gemini_error::ErrorClassifier::rethrow_enriched(e);
        }

        throw gemini_error::DispatchFailed("Unsupported request shape");
    }

    UploadedFile RequestDispatcher::upload(const std::filesystem::path& file) {
        http::model::Request req;
        req.url_ = gemini::protocol::Endpoint::UPLOAD;
        req.method_ = "POST";
        req.headers_ = gemini::protocol::UPLOAD_HEADERS;
        req.upload_file_ = file;

        http::model::Response resp;
        try {
            resp = session_.transport().post(req);
        } catch (const std::exception& e) {
            throw gemini_error::DispatchFailed("Failed to upload " + file.string() + ": " + e.what());
        }

        if (!http::http_error::is_success(resp)) {
            throw gemini_error::DispatchFailed("Failed to upload " + file.string() + ": status " + std::to_string(resp.status_));
        }

        std::string id = string_utils::trim(resp.body_);
        if (id.empty()) {
            throw gemini_error::DispatchFailed("Upload of " + file.string() + " returned no file identifier");
        }

        spdlog::debug("Uploaded {}", file.string());
        return UploadedFile{.id_ = std::move(id), .name_ = file.filename().string()};
    }

    std::vector<UploadedFile> RequestDispatcher::upload_all(const std::vector<std::filesystem::path>& files) {
        std::vector<UploadedFile> out;
        out.reserve(files.size());
        for (const auto& file : files) {
            out.push_back(upload(file));
        }
        return out;
    }

    ResponseEnvelope RequestDispatcher::send(const std::string& prompt, const std::vector<UploadedFile>& files, const ChatMetadata& metadata,
                                             const std::string& model, const std::vector<std::string>& model_headers, ResponseCapture& capture) {
        const http::model::Request req = session_.with_cookies(gemini::protocol::build_generate_request(
            session_.access_token(), session_.next_request_id(), prompt, files, metadata, model_headers));

        http::model::Response resp;
        try {
            resp = session_.transport().post(req);
        } catch (const std::exception& e) {
            throw gemini_error::DispatchFailed(std::string("Failed to generate contents: ") + e.what(), capture.body_);
        }

        capture.observe(req, resp);

        if (!http::http_error::is_success(resp)) {
            throw gemini_error::DispatchFailed("Failed to generate contents. Request failed with status code " + std::to_string(resp.status_),
                                               capture.body_);
        }

        ResponseEnvelope envelope = gemini::protocol::ResponseParser::parse(resp.body_, model);
        envelope.model_ = model;
        envelope.raw_body_ = capture.body_;
        return envelope;
    }
}  // namespace gemini::dispatch
