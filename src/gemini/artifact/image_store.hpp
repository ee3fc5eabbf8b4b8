#ifndef GEMINI_WEB_IMAGE_STORE_HPP
#define GEMINI_WEB_IMAGE_STORE_HPP

#include <filesystem>
#include <string_view>

#include "../dispatch/types.hpp"
#include "../session/session.hpp"

namespace gemini::artifact {
    class IImageStore {
       public:
        IImageStore() = default;
        virtual ~IImageStore() = default;
        IImageStore(const IImageStore&) = delete;
        IImageStore& operator=(const IImageStore&) = delete;
        IImageStore(IImageStore&&) = delete;
        IImageStore& operator=(IImageStore&&) = delete;

        // Either the whole image lands at `destination` or nothing does and this throws.
        virtual void save(const gemini::dispatch::ImageRef& image, const std::filesystem::path& destination) = 0;
    };

    // Downloads through the session transport, reusing its cookies and proxy.
    class ImageStore : public IImageStore {
       public:
        explicit ImageStore(gemini::session::Session& session);

        void save(const gemini::dispatch::ImageRef& image, const std::filesystem::path& destination) override;

        static void write_atomic(const std::filesystem::path& p, std::string_view bytes);

       private:
        gemini::session::Session& session_;
    };
}  // namespace gemini::artifact

#endif
