#include "image_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "../../http/error/http_error.hpp"
#include "../../utils/string_utils.hpp"
#include "../protocol/constants.hpp"

namespace gemini::artifact {
    namespace {
        constexpr const char* TMP_FILE_EXT = ".part";
        constexpr const char* IMAGE_CONTENT_TYPE = "image/";
    }  // namespace

    ImageStore::ImageStore(gemini::session::Session& session) : session_(session) {}

    void ImageStore::save(const gemini::dispatch::ImageRef& image, const std::filesystem::path& destination) {
        http::model::Request req;
        req.url_ = image.url_;
        if (image.generated_) {
            req.url_ += gemini::protocol::FULL_SIZE_SUFFIX;
            req = session_.with_cookies(std::move(req));
        }

        const http::model::Response resp = session_.transport().get_with_retries(req, session_.options().retry_policy_);

        if (!http::http_error::is_success(resp)) {
            throw http::http_error::HttpError::from_response(resp, req.url_, "Image download");
        }

        if (!string_utils::ieq_prefix(resp.content_type_.c_str(), resp.content_type_.size(), IMAGE_CONTENT_TYPE)) {
            throw http::http_error::HttpError(resp.status_, req.url_, resp.body_.substr(0, http::http_error::ERROR_MESSAGE_LENGTH),
                                              "Image download returned content type '" + resp.content_type_ + "'");
        }

        write_atomic(destination, resp.body_);
        spdlog::debug("Saved {} bytes to {}", resp.body_.size(), destination.string());
    }

    void ImageStore::write_atomic(const std::filesystem::path& p, std::string_view bytes) {
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        const auto tmp = string_utils::append_to_path(p, TMP_FILE_EXT);
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("Cannot open " + tmp.string() + " for writing");
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                throw std::runtime_error("Failed to write " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, p);
    }
}  // namespace gemini::artifact
