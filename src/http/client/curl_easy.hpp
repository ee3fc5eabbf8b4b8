#ifndef GEMINI_WEB_CURL_EASY_HPP
#define GEMINI_WEB_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"
#include "transport_options.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = 256;

    enum class HttpStatusCode : long {
        TOO_MANY_REQUESTS = 429,
        BAD_GATEWAY = 502,
        SERVICE_UNAVAILABLE = 503,
        GATEWAY_TIMEOUT = 504,
        OK = 200,
    };

    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(TransportOptions options);

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response get(const http::model::Request& req) override;
        http::model::Response post(const http::model::Request& req) override;
        http::model::Response get_with_retries(const http::model::Request& req, const RetryPolicy& p = {}) override;
        void close() override;

        static std::chrono::milliseconds get_retry_delay(const RetryPolicy& p, std::chrono::milliseconds& delay);
        // Wait requested by a 429 Retry-After header, capped at p.max_delay_. Empty when absent or unparsable.
        static std::optional<std::chrono::milliseconds> retry_after_delay(const RetryPolicy& p, const std::string& retry_after);
        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void enable_keepalive();
        void enable_compression();
        void prefer_http2_tls();

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void ensure_open() const;
        void release();
        void perform_throw();
        http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void prepare_for_new_request(std::string& body);
        void attach_upload(const std::filesystem::path& file);
        [[nodiscard]] std::string encode_form(const std::vector<std::pair<std::string, std::string>>& fields) const;
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static bool is_retryable_http(long code) {
            return code == static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS) || code == static_cast<long>(HttpStatusCode::BAD_GATEWAY) ||
                   code == static_cast<long>(HttpStatusCode::SERVICE_UNAVAILABLE) || code == static_cast<long>(HttpStatusCode::GATEWAY_TIMEOUT);
        }

        TransportOptions options_;

        std::string last_retry_after_;
        std::string last_content_type_;
        std::vector<std::string> last_set_cookies_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};
        curl_mime* mime_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
