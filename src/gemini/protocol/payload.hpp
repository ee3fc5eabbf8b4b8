#ifndef GEMINI_WEB_PROTOCOL_PAYLOAD_HPP
#define GEMINI_WEB_PROTOCOL_PAYLOAD_HPP

#include <string>
#include <vector>

#include "../../http/model/model.hpp"
#include "../dispatch/types.hpp"

namespace gemini::protocol {
    // The f.req form value: [null, "<[message, null, metadata]>"].
    [[nodiscard]] std::string build_freq(const std::string& prompt, const std::vector<gemini::dispatch::UploadedFile>& files,
                                         const gemini::dispatch::ChatMetadata& metadata);

    // Generation POST without cookies; the session adds those.
    [[nodiscard]] http::model::Request build_generate_request(const std::string& access_token, long request_id, const std::string& prompt,
                                                              const std::vector<gemini::dispatch::UploadedFile>& files,
                                                              const gemini::dispatch::ChatMetadata& metadata,
                                                              const std::vector<std::string>& model_headers);
}  // namespace gemini::protocol

#endif
