#include "payload.hpp"

#include <json/json.h>

#include <string>

#include "constants.hpp"

namespace gemini::protocol {
    namespace {
        std::string to_compact_json(const Json::Value& value) {
            Json::StreamWriterBuilder builder;
            builder["indentation"] = "";
            return Json::writeString(builder, value);
        }
    }  // namespace

    std::string build_freq(const std::string& prompt, const std::vector<gemini::dispatch::UploadedFile>& files,
                           const gemini::dispatch::ChatMetadata& metadata) {
        Json::Value message(Json::arrayValue);
        message.append(prompt);

        if (!files.empty()) {
            Json::Value file_list(Json::arrayValue);
            for (const auto& file : files) {
                Json::Value id(Json::arrayValue);
                id.append(file.id_);

                Json::Value entry(Json::arrayValue);
                entry.append(id);
                entry.append(file.name_);
                file_list.append(entry);
            }
            message.append(0);
            message.append(Json::Value());
            message.append(file_list);
        }

        Json::Value chat;
        if (!metadata.empty()) {
            chat = Json::Value(Json::arrayValue);
            chat.append(metadata.cid_);
            chat.append(metadata.rid_);
            chat.append(metadata.rcid_);
        }

        Json::Value inner(Json::arrayValue);
        inner.append(message);
        inner.append(Json::Value());
        inner.append(chat);

        Json::Value outer(Json::arrayValue);
        outer.append(Json::Value());
        outer.append(to_compact_json(inner));
        return to_compact_json(outer);
    }

    http::model::Request build_generate_request(const std::string& access_token, long request_id, const std::string& prompt,
                                                const std::vector<gemini::dispatch::UploadedFile>& files,
                                                const gemini::dispatch::ChatMetadata& metadata, const std::vector<std::string>& model_headers) {
        http::model::Request r;
        r.url_ = std::string(Endpoint::GENERATE) + "?_reqid=" + std::to_string(request_id) + "&rt=c";
        r.method_ = "POST";
        r.headers_ = GEMINI_HEADERS;
        r.headers_.insert(r.headers_.end(), model_headers.begin(), model_headers.end());
        r.form_fields_ = {
            {"at", access_token},
            {"f.req", build_freq(prompt, files, metadata)},
        };
        return r;
    }
}  // namespace gemini::protocol
