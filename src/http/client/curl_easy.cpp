#include "curl_easy.hpp"

#include <curl/curl.h>

#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"

using namespace std::chrono;

namespace http::client {

    struct CurlDefaults {
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr long MS_PER_S = 1'000L;
        static constexpr const char* USER_AGENT =
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long POST = 0L;
        static constexpr long UPLOAD = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr long HTTP_GET = 1L;
        static constexpr const char* UPLOAD_FIELD = "file";
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type:";
        static constexpr const char* RETRY_AFTER = "retry-after:";
        static constexpr const char* SET_COOKIE = "set-cookie:";
        static constexpr const char* STATUS_LINE = "HTTP/";
    };

    CurlEasy::CurlEasy(TransportOptions options) : options_(std::move(options)), handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() { release(); }

    void CurlEasy::close() { release(); }

    void CurlEasy::release() {
        if (mime_ != nullptr) {
            curl_mime_free(mime_);
            mime_ = nullptr;
        }

        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
            handle_ = nullptr;
        }
    }

    void CurlEasy::ensure_open() const {
        if (handle_ == nullptr) {
            throw std::runtime_error("HTTP transport used after close");
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : options_.default_headers_) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, options_.follow_redirects_ ? 1L : 0L);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_TIMEOUT_MS, options_.timeout_s_ * CurlDefaults::MS_PER_S);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);

        if (!options_.verify_tls_) {
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
        }

        if (!options_.proxy_.empty()) {
            setopt(CURLOPT_PROXY, options_.proxy_.c_str());
        }

        enable_keepalive();
        enable_compression();
        prefer_http2_tls();
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::enable_compression() {
        // Empty string => accept all supported encodings (gzip/deflate/br)
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    }

    void CurlEasy::prefer_http2_tls() { setopt(CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_2TLS)); }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        ensure_open();

        last_set_cookies_.clear();
        last_content_type_.clear();
        last_retry_after_.clear();
        body.clear();

        if (mime_ != nullptr) {
            setopt(CURLOPT_MIMEPOST, static_cast<curl_mime*>(nullptr));
            curl_mime_free(mime_);
            mime_ = nullptr;
        }

        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&body));
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));

        setopt(CURLOPT_POST, CurlDefaults::POST);
        setopt(CURLOPT_UPLOAD, CurlDefaults::UPLOAD);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts the next response of a redirect chain. Cookies accumulate, the rest is per response.
        if (string_utils::ieq_prefix(buffer, bytes, HeaderKeys::STATUS_LINE)) {
            self->last_content_type_.clear();
            self->last_retry_after_.clear();
            return bytes;
        }

        std::string cookie;
        if (string_utils::extract_header_value(buffer, bytes, HeaderKeys::SET_COOKIE, cookie)) {
            self->last_set_cookies_.push_back(std::move(cookie));
            return bytes;
        }

        string_utils::extract_header_value(buffer, bytes, HeaderKeys::CONTENT_TYPE, self->last_content_type_);
        string_utils::extract_header_value(buffer, bytes, HeaderKeys::RETRY_AFTER, self->last_retry_after_);

        return bytes;
    }

    http::model::Response CurlEasy::get(const http::model::Request& req) {
        std::string body;
        prepare_for_new_request(body);

        set_url(req.url_);
        set_headers(req.headers_);

        perform_throw();
        return make_response(body);
    }

    http::model::Response CurlEasy::post(const http::model::Request& req) {
        std::string body;
        prepare_for_new_request(body);

        set_url(req.url_);
        set_headers(req.headers_);

        // libcurl does not copy POSTFIELDS; payload must outlive perform.
        std::string payload;
        if (req.upload_file_) {
            attach_upload(*req.upload_file_);
        } else {
            payload = req.form_fields_.empty() ? req.body_ : encode_form(req.form_fields_);
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
            setopt(CURLOPT_POSTFIELDS, payload.c_str());
        }

        perform_throw();
        return make_response(body);
    }

    void CurlEasy::attach_upload(const std::filesystem::path& file) {
        mime_ = curl_mime_init(handle_);
        if (mime_ == nullptr) {
            throw std::runtime_error("curl_mime_init failed");
        }

        curl_mimepart* part = curl_mime_addpart(mime_);
        curl_mime_name(part, CurlDefaults::UPLOAD_FIELD);

        const auto rc = curl_mime_filedata(part, file.string().c_str());
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to attach " + file.string() + ": " + curl_easy_strerror(rc));
        }

        setopt(CURLOPT_MIMEPOST, mime_);
    }

    std::string CurlEasy::encode_form(const std::vector<std::pair<std::string, std::string>>& fields) const {
        auto escape = [this](const std::string& s) {
            char* escaped = curl_easy_escape(handle_, s.c_str(), static_cast<int>(s.size()));
            if (escaped == nullptr) {
                throw std::runtime_error("curl_easy_escape failed");
            }
            std::string out(escaped);
            curl_free(escaped);
            return out;
        };

        std::string encoded;
        for (const auto& [key, value] : fields) {
            if (!encoded.empty()) {
                encoded += '&';
            }
            encoded += escape(key);
            encoded += '=';
            encoded += escape(value);
        }
        return encoded;
    }

    http::model::Response CurlEasy::get_with_retries(const http::model::Request& req, const RetryPolicy& p) {
        milliseconds delay = p.base_delay_;

        for (size_t attempt = 1; attempt <= p.max_tries_; ++attempt) {
            try {
                auto resp = get(req);

                if (!is_retryable_http(resp.status_) || attempt == p.max_tries_) {
                    return resp;
                }

                if (resp.status_ == static_cast<long>(HttpStatusCode::TOO_MANY_REQUESTS)) {
                    if (auto wait = CurlEasy::retry_after_delay(p, resp.retry_after_)) {
                        std::this_thread::sleep_for(*wait);
                        continue;
                    }
                }

                delay = CurlEasy::get_retry_delay(p, delay);
            } catch (const std::exception&) {
                if (attempt < p.max_tries_) {
                    delay = CurlEasy::get_retry_delay(p, delay);
                    continue;
                }
                throw;
            }
        }

        return {};
    }

    std::optional<milliseconds> CurlEasy::retry_after_delay(const RetryPolicy& p, const std::string& retry_after) {
        if (retry_after.empty()) {
            return std::nullopt;
        }

        char* end = nullptr;
        const long s = std::strtol(retry_after.c_str(), &end, constants::BASE_10);
        if (s <= 0) {
            return std::nullopt;
        }
        // Server hints never outlast the policy's own ceiling.
        return std::min(duration_cast<milliseconds>(seconds{s}), p.max_delay_);
    }

    milliseconds CurlEasy::get_retry_delay(const RetryPolicy& p, milliseconds& delay) {
        std::minstd_rand rng{std::random_device{}()};

        auto jitter = [&](milliseconds base) {
            std::uniform_int_distribution<int> d(0, static_cast<int>(base.count()));
            return milliseconds{d(rng)};
        };

        std::this_thread::sleep_for(delay + jitter(p.base_delay_));
        return std::min(delay * 2, p.max_delay_);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw() {
        error_buf_[0] = '\0';
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw std::runtime_error(err);
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.content_type_ = std::move(last_content_type_);
        r.retry_after_ = std::move(last_retry_after_);
        r.set_cookies_ = std::move(last_set_cookies_);
        return r;
    }

}  // namespace http::client
