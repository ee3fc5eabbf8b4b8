#ifndef GEMINI_WEB_MODEL_HPP
#define GEMINI_WEB_MODEL_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace http::model {
    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        std::vector<std::string> headers_;

        // Url-encoded by the transport; takes precedence over body_.
        std::vector<std::pair<std::string, std::string>> form_fields_;

        // Sent as the multipart "file" part; takes precedence over form_fields_.
        std::optional<std::filesystem::path> upload_file_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;
        std::string content_type_;
        std::string retry_after_;

        // Raw values of every Set-Cookie header seen, redirects included.
        std::vector<std::string> set_cookies_;
    };
}  // namespace http::model

#endif
