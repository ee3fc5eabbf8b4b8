#ifndef GEMINI_WEB_PROTOCOL_RESPONSE_PARSER_HPP
#define GEMINI_WEB_PROTOCOL_RESPONSE_PARSER_HPP

#include <string>

#include "../dispatch/types.hpp"

namespace gemini::protocol {
    class ResponseParser {
       public:
        // Parses a StreamGenerate body into an envelope. raw_body_ and model_ are left for the caller.
        // Throws ModelInvalid for model error codes and DispatchFailed when no candidate can be found.
        [[nodiscard]] static gemini::dispatch::ResponseEnvelope parse(const std::string& body, const std::string& model);
    };
}  // namespace gemini::protocol

#endif
