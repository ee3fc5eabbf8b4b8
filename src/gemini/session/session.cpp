#include "session.hpp"

#include <spdlog/spdlog.h>

#include <random>
#include <stdexcept>

#include "../protocol/constants.hpp"
#include "cookie_rotator.hpp"

namespace gemini::session {
    namespace {
        constexpr long REQUEST_ID_MIN = 1000;
        constexpr long REQUEST_ID_MAX = 9999;
        constexpr long REQUEST_ID_STEP = 100'000;
    }  // namespace

    Session::Session(SessionOptions options, http::client::HttpClientFactory factory)
        : options_(std::move(options)), factory_(std::move(factory)), request_id_([] {
              std::minstd_rand rng{std::random_device{}()};
              return std::uniform_int_distribution<long>(REQUEST_ID_MIN, REQUEST_ID_MAX)(rng);
          }()) {
        if (factory_ == nullptr) {
            throw std::invalid_argument("Session requires an HTTP client factory");
        }
    }

    Session::~Session() { close(); }

    const SessionOptions& Session::options() const { return options_; }

    // Per-request headers differ by host (app page, upload service, image CDN), so none are bound here.
    http::client::TransportOptions Session::transport_options() const {
        http::client::TransportOptions t;
        t.timeout_s_ = options_.timeout_s_;
        t.proxy_ = options_.proxy_;
        t.verify_tls_ = options_.verify_tls_;
        t.follow_redirects_ = true;
        return t;
    }

    std::unique_ptr<http::client::IHttpClient> Session::make_transport() const {
        auto transport = factory_(transport_options());
        if (transport == nullptr) {
            throw std::runtime_error("HTTP client factory returned no transport");
        }
        return transport;
    }

    http::cookie::CookieMap& Session::cookies() { return cookies_; }

    const http::cookie::CookieMap& Session::cookies() const { return cookies_; }

    const std::string& Session::access_token() const { return access_token_; }

    bool Session::is_running() const { return running_; }

    bool Session::is_closed() const { return closed_; }

    void Session::install(std::unique_ptr<http::client::IHttpClient> transport, std::string access_token, http::cookie::CookieMap cookies) {
        if (transport_ != nullptr) {
            transport_->close();
        }

        transport_ = std::move(transport);
        access_token_ = std::move(access_token);
        cookies_ = std::move(cookies);
        running_ = true;
        closed_ = false;
    }

    http::client::IHttpClient& Session::transport() {
        if (!running_ || transport_ == nullptr) {
            throw std::logic_error("Session is not running; bootstrap it first");
        }
        return *transport_;
    }

    http::model::Request Session::with_cookies(http::model::Request req) const {
        std::string header = http::cookie::cookie_header(cookies_);
        if (!header.empty()) {
            req.headers_.push_back(std::move(header));
        }
        return req;
    }

    long Session::next_request_id() {
        const long id = request_id_;
        request_id_ += REQUEST_ID_STEP;
        return id;
    }

    void Session::mark_rotated(std::chrono::steady_clock::time_point at) { last_rotation_ = at; }

    bool Session::rotation_due(std::chrono::steady_clock::time_point now) const {
        if (!options_.auto_refresh_ || !last_rotation_) {
            return false;
        }
        return now - *last_rotation_ >= std::chrono::seconds(options_.refresh_interval_s_);
    }

    void Session::refresh_if_due() {
        const auto now = std::chrono::steady_clock::now();
        if (!running_ || !rotation_due(now) || !CookieRotator::can_rotate(cookies_)) {
            return;
        }

        // Counted as an attempt either way so a failing rotation is not retried on every dispatch.
        mark_rotated(now);
        try {
            if (auto rotated = CookieRotator::rotate(*transport_, cookies_)) {
                cookies_[gemini::protocol::CookieNames::SECURE_1PSIDTS] = std::move(*rotated);
                spdlog::debug("Refreshed {}", gemini::protocol::CookieNames::SECURE_1PSIDTS);
            }
        } catch (const std::exception& e) {
            spdlog::debug("Cookie refresh failed, keeping current value: {}", e.what());
        }
    }

    void Session::close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        running_ = false;

        if (transport_ != nullptr) {
            transport_->close();
            transport_.reset();
        }
    }
}  // namespace gemini::session
