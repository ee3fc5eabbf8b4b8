#ifndef GEMINI_WEB_DISPATCH_TYPES_HPP
#define GEMINI_WEB_DISPATCH_TYPES_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gemini::dispatch {
    enum class RequestShape { PLAIN, ATTACHMENT, EDIT };

    // Immutable once built. A different model means a different Request (see with_model).
    struct Request {
        std::string prompt_;
        std::vector<std::filesystem::path> attachments_;
        std::optional<std::filesystem::path> edit_base_;
        std::string model_;

        [[nodiscard]] RequestShape shape() const;
        [[nodiscard]] Request with_model(std::string model) const;
    };

    struct ImageRef {
        std::string url_;
        std::string title_;
        std::string alt_;

        // Generated images need the session cookies and are fetched at full size.
        bool generated_ = false;
    };

    // [conversation id, reply id, candidate id]; empty until the first reply of a chat.
    struct ChatMetadata {
        std::string cid_;
        std::string rid_;
        std::string rcid_;

        [[nodiscard]] bool empty() const { return cid_.empty() && rid_.empty() && rcid_.empty(); }
    };

    struct ResponseEnvelope {
        std::string text_;
        std::optional<std::string> thoughts_;
        std::vector<ImageRef> images_;
        ChatMetadata metadata_;

        // Model that produced this envelope after any fallback.
        std::string model_;

        // Last captured StreamGenerate body. Diagnostics and image URL scanning only.
        std::string raw_body_;
    };

    struct UploadedFile {
        std::string id_;
        std::string name_;
    };
}  // namespace gemini::dispatch

#endif
