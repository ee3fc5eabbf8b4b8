#ifndef GEMINI_WEB_TRANSPORT_OPTIONS_HPP
#define GEMINI_WEB_TRANSPORT_OPTIONS_HPP

#include <string>
#include <vector>

#include "../../utils/constants.hpp"

namespace http::client {
    struct TransportOptions {
        long timeout_s_ = constants::DEFAULT_TIMEOUT_S;
        std::string proxy_;
        bool follow_redirects_ = true;
        bool verify_tls_ = true;

        // Sent with every request, before the request's own headers.
        std::vector<std::string> default_headers_;
    };
}  // namespace http::client

#endif
