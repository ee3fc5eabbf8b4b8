#ifndef GEMINI_WEB_REQUEST_DISPATCHER_HPP
#define GEMINI_WEB_REQUEST_DISPATCHER_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "../../http/model/model.hpp"
#include "../session/session.hpp"
#include "types.hpp"

namespace gemini::dispatch {
    inline constexpr const char* DEFAULT_FALLBACK_MODEL = "gemini-2.5-flash";
    inline constexpr const char* EDIT_INTRO_PROMPT = "Here is an image to edit";

    // Second message of the edit shape.
    [[nodiscard]] std::string edit_prompt(const std::string& prompt);

    struct DispatcherOptions {
        std::string default_fallback_model_ = DEFAULT_FALLBACK_MODEL;
    };

    // Keeps the body of the last generation response seen during one dispatch.
    struct ResponseCapture {
        std::string body_;

        void observe(const http::model::Request& req, const http::model::Response& resp);
    };

    class IRequestDispatcher {
       public:
        IRequestDispatcher() = default;
        virtual ~IRequestDispatcher() = default;
        IRequestDispatcher(const IRequestDispatcher&) = delete;
        IRequestDispatcher& operator=(const IRequestDispatcher&) = delete;
        IRequestDispatcher(IRequestDispatcher&&) = delete;
        IRequestDispatcher& operator=(IRequestDispatcher&&) = delete;

        // Applies the model fallback policy: one retry with the default fallback model on ModelInvalid.
        virtual ResponseEnvelope dispatch(const Request& request) = 0;

        // Exactly request.model_, no fallback.
        virtual ResponseEnvelope dispatch_once(const Request& request) = 0;
    };

    class RequestDispatcher : public IRequestDispatcher {
       public:
        explicit RequestDispatcher(gemini::session::Session& session, DispatcherOptions options = {});

        ResponseEnvelope dispatch(const Request& request) override;
        ResponseEnvelope dispatch_once(const Request& request) override;

       private:
        UploadedFile upload(const std::filesystem::path& file);
        std::vector<UploadedFile> upload_all(const std::vector<std::filesystem::path>& files);
        ResponseEnvelope send(const std::string& prompt, const std::vector<UploadedFile>& files, const ChatMetadata& metadata,
                              const std::string& model, const std::vector<std::string>& model_headers, ResponseCapture& capture);

        gemini::session::Session& session_;
        DispatcherOptions options_;
    };
}  // namespace gemini::dispatch

#endif
