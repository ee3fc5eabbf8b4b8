#ifndef GEMINI_WEB_HTTP_ERROR_HPP
#define GEMINI_WEB_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

#include "../model/model.hpp"

namespace http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    struct HttpError : public std::runtime_error {
        long status_;
        std::string url_;
        std::string body_preview_;
        explicit HttpError(long s, std::string u, std::string preview, const std::string &msg);

        // Builds the error for a response whose status fell outside 2xx.
        static HttpError from_response(const http::model::Response &resp, const std::string &url, const std::string &what);
    };

    [[nodiscard]] bool is_success(const http::model::Response &resp);
}  // namespace http::http_error

#endif
