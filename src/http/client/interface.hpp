#ifndef GEMINI_WEB_CLIENT_INTERFACE_HPP
#define GEMINI_WEB_CLIENT_INTERFACE_HPP

#include <chrono>
#include <functional>
#include <memory>

#include "../model/model.hpp"
#include "transport_options.hpp"

namespace http::client {
    const long BASE_DELAY_MS = 300;
    const long MAX_DELAY_MS = 1500;

    struct RetryPolicy {
        size_t max_tries_ = 3;
        std::chrono::milliseconds base_delay_{BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{MAX_DELAY_MS};
    };

    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        virtual http::model::Response get(const http::model::Request& req) = 0;
        virtual http::model::Response post(const http::model::Request& req) = 0;
        virtual http::model::Response get_with_retries(const http::model::Request& req, const RetryPolicy& p = {}) = 0;

        // Releases the underlying connection. Calling it again is a no-op.
        virtual void close() = 0;
    };

    using HttpClientFactory = std::function<std::unique_ptr<IHttpClient>(const TransportOptions&)>;
}  // namespace http::client

#endif
