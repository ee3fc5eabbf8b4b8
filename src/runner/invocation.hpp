#ifndef GEMINI_WEB_INVOCATION_HPP
#define GEMINI_WEB_INVOCATION_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>

#include "../config/client_config.hpp"
#include "../gemini/artifact/artifact_resolver.hpp"
#include "../gemini/artifact/image_store.hpp"
#include "../gemini/dispatch/request_dispatcher.hpp"
#include "../gemini/dispatch/types.hpp"
#include "../gemini/session/session.hpp"
#include "../http/client/interface.hpp"

namespace runner {
    inline constexpr int EXIT_OK = 0;
    inline constexpr int EXIT_FAILURE_CODE = 1;

    using ImageStoreFactory = std::function<std::unique_ptr<gemini::artifact::IImageStore>(gemini::session::Session&)>;

    struct InvocationResult {
        gemini::dispatch::ResponseEnvelope envelope_;

        // Set only when an image was requested.
        std::optional<gemini::artifact::ResolutionOutcome> resolution_;

        [[nodiscard]] bool artifact_missing() const { return resolution_.has_value() && !resolution_->resolved(); }
        [[nodiscard]] int exit_code() const { return artifact_missing() ? EXIT_FAILURE_CODE : EXIT_OK; }
    };

    // One prompt from bootstrap to teardown. The session is closed on every path.
    class Invocation {
       public:
        void set_http_client_factory(http::client::HttpClientFactory http_client_factory);
        void set_image_store_factory(ImageStoreFactory image_store_factory);
        void set_config(config::ClientConfig config);
        void set_fallback_plan(gemini::artifact::FallbackPlan fallback_plan);
        void set_dispatcher_options(gemini::dispatch::DispatcherOptions dispatcher_options);

        [[nodiscard]] const http::client::HttpClientFactory& get_http_client_factory() const;
        [[nodiscard]] const ImageStoreFactory& get_image_store_factory() const;
        [[nodiscard]] const gemini::artifact::FallbackPlan& get_fallback_plan() const;

        // Bootstrap and dispatch failures propagate. A missing image is reported through the result.
        [[nodiscard]] InvocationResult run(const gemini::dispatch::Request& request, bool wants_image, const std::filesystem::path& output_path) const;

       private:
        http::client::HttpClientFactory http_client_factory_;
        ImageStoreFactory image_store_factory_;
        config::ClientConfig config_;
        gemini::artifact::FallbackPlan fallback_plan_ = gemini::artifact::FallbackPlan::of(gemini::artifact::DEFAULT_IMAGE_FALLBACK_MODELS);
        gemini::dispatch::DispatcherOptions dispatcher_options_;
    };

    class InvocationBuilder {
       public:
        InvocationBuilder();

        InvocationBuilder& with_http_client_factory(http::client::HttpClientFactory http_client_factory);
        InvocationBuilder& with_image_store_factory(ImageStoreFactory image_store_factory);
        InvocationBuilder& with_config(config::ClientConfig config);
        InvocationBuilder& with_fallback_plan(gemini::artifact::FallbackPlan fallback_plan);
        InvocationBuilder& with_dispatcher_options(gemini::dispatch::DispatcherOptions dispatcher_options);
        InvocationBuilder& validate();
        std::unique_ptr<Invocation> build();

       private:
        std::unique_ptr<Invocation> invocation_;
    };
}  // namespace runner

#endif
