#ifndef GEMINI_WEB_SESSION_HPP
#define GEMINI_WEB_SESSION_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "../../http/client/interface.hpp"
#include "../../http/cookie/cookie_map.hpp"
#include "../../http/model/model.hpp"
#include "../../utils/constants.hpp"

namespace gemini::session {
    struct SessionOptions {
        long timeout_s_ = constants::DEFAULT_TIMEOUT_S;
        std::string proxy_;
        bool verify_tls_ = true;
        bool auto_refresh_ = true;
        long refresh_interval_s_ = constants::DEFAULT_REFRESH_INTERVAL_S;
        http::client::RetryPolicy retry_policy_{};
    };

    // Closes a short-lived transport on every exit path.
    class ScopedTransport {
       public:
        explicit ScopedTransport(std::unique_ptr<http::client::IHttpClient> transport) : transport_(std::move(transport)) {}

        ~ScopedTransport() {
            if (transport_ != nullptr) {
                transport_->close();
            }
        }
        ScopedTransport(const ScopedTransport&) = delete;
        ScopedTransport& operator=(const ScopedTransport&) = delete;
        ScopedTransport(ScopedTransport&&) = delete;
        ScopedTransport& operator=(ScopedTransport&&) = delete;

        http::client::IHttpClient& operator*() const { return *transport_; }
        http::client::IHttpClient* operator->() const { return transport_.get(); }

       private:
        std::unique_ptr<http::client::IHttpClient> transport_;
    };

    // One authenticated connection context. Owns the transport exclusively and closes it exactly once.
    class Session {
       public:
        Session(SessionOptions options, http::client::HttpClientFactory factory);

        ~Session();
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        [[nodiscard]] const SessionOptions& options() const;
        [[nodiscard]] http::client::TransportOptions transport_options() const;
        [[nodiscard]] std::unique_ptr<http::client::IHttpClient> make_transport() const;

        [[nodiscard]] http::cookie::CookieMap& cookies();
        [[nodiscard]] const http::cookie::CookieMap& cookies() const;
        [[nodiscard]] const std::string& access_token() const;
        [[nodiscard]] bool is_running() const;
        [[nodiscard]] bool is_closed() const;

        // Takes ownership of the authenticated transport, closing any transport installed before.
        void install(std::unique_ptr<http::client::IHttpClient> transport, std::string access_token, http::cookie::CookieMap cookies);

        // Throws if the session is not running.
        [[nodiscard]] http::client::IHttpClient& transport();

        // Copies `req` with the session cookies attached.
        [[nodiscard]] http::model::Request with_cookies(http::model::Request req) const;

        [[nodiscard]] long next_request_id();

        void mark_rotated(std::chrono::steady_clock::time_point at);
        [[nodiscard]] bool rotation_due(std::chrono::steady_clock::time_point now) const;

        // Rotates the timestamp cookie when auto refresh is on and the interval elapsed. Best effort.
        void refresh_if_due();

        // Idempotent. Called by the destructor as well.
        void close();

       private:
        SessionOptions options_;
        http::client::HttpClientFactory factory_;
        http::cookie::CookieMap cookies_;
        std::string access_token_;
        std::unique_ptr<http::client::IHttpClient> transport_;
        std::optional<std::chrono::steady_clock::time_point> last_rotation_;
        long request_id_;
        bool running_ = false;
        bool closed_ = false;
    };
}  // namespace gemini::session

#endif
