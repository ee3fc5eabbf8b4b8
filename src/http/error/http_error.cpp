#include "http_error.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"

namespace http::http_error {
    HttpError::HttpError(long s, std::string u,
                         std::string preview,     // NOLINT(bugprone-easily-swappable-parameters)
                         const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), status_(s), url_(std::move(u)), body_preview_(std::move(preview)) {}

    HttpError HttpError::from_response(const http::model::Response &resp, const std::string &url, const std::string &what) {
        const std::string effective = resp.effective_url_.empty() ? url : resp.effective_url_;
        return HttpError(resp.status_, effective, resp.body_.substr(0, ERROR_MESSAGE_LENGTH),
                         what + " failed with status " + std::to_string(resp.status_));
    }

    bool is_success(const http::model::Response &resp) {
        return resp.status_ >= constants::HTTP_OK && resp.status_ < constants::HTTP_SUCCESS_UPPER_BOUNDARY;
    }
};  // namespace http::http_error
