#include "invocation.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "../gemini/session/session_bootstrapper.hpp"

namespace runner {
    //
    // InvocationBuilder implementation
    //

    InvocationBuilder::InvocationBuilder() : invocation_(std::make_unique<Invocation>()) {
        invocation_->set_image_store_factory(
            [](gemini::session::Session& session) { return std::make_unique<gemini::artifact::ImageStore>(session); });
    }

    InvocationBuilder& InvocationBuilder::with_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        invocation_->set_http_client_factory(std::move(http_client_factory));
        return *this;
    }

    InvocationBuilder& InvocationBuilder::with_image_store_factory(ImageStoreFactory image_store_factory) {
        invocation_->set_image_store_factory(std::move(image_store_factory));
        return *this;
    }

    InvocationBuilder& InvocationBuilder::with_config(config::ClientConfig config) {
        invocation_->set_config(std::move(config));
        return *this;
    }

    InvocationBuilder& InvocationBuilder::with_fallback_plan(gemini::artifact::FallbackPlan fallback_plan) {
        invocation_->set_fallback_plan(std::move(fallback_plan));
        return *this;
    }

    InvocationBuilder& InvocationBuilder::with_dispatcher_options(gemini::dispatch::DispatcherOptions dispatcher_options) {
        invocation_->set_dispatcher_options(std::move(dispatcher_options));
        return *this;
    }

    InvocationBuilder& InvocationBuilder::validate() {
        if (invocation_->get_http_client_factory() == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        if (invocation_->get_image_store_factory() == nullptr) {
            throw std::runtime_error("Image store factory is required");
        }
        if (invocation_->get_fallback_plan().models_.empty()) {
            throw std::runtime_error("Image fallback plan needs at least one model");
        }
        return *this;
    }

    std::unique_ptr<Invocation> InvocationBuilder::build() { return std::move(invocation_); }

    //
    // Invocation implementation
    //

    void Invocation::set_http_client_factory(http::client::HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
    }

    void Invocation::set_image_store_factory(ImageStoreFactory image_store_factory) { image_store_factory_ = std::move(image_store_factory); }

    void Invocation::set_config(config::ClientConfig config) { config_ = std::move(config); }

    void Invocation::set_fallback_plan(gemini::artifact::FallbackPlan fallback_plan) { fallback_plan_ = std::move(fallback_plan); }

    void Invocation::set_dispatcher_options(gemini::dispatch::DispatcherOptions dispatcher_options) {
        dispatcher_options_ = std::move(dispatcher_options);
    }

    const http::client::HttpClientFactory& Invocation::get_http_client_factory() const { return http_client_factory_; }

    const ImageStoreFactory& Invocation::get_image_store_factory() const { return image_store_factory_; }

    const gemini::artifact::FallbackPlan& Invocation::get_fallback_plan() const { return fallback_plan_; }

    InvocationResult Invocation::run(const gemini::dispatch::Request& request, bool wants_image, const std::filesystem::path& output_path) const {
        gemini::session::Session session(config_.session_, http_client_factory_);

        spdlog::info("Initializing Gemini client...");
        gemini::session::SessionBootstrapper::bootstrap(session, config_.cookies_);

        gemini::dispatch::RequestDispatcher dispatcher(session, dispatcher_options_);

        InvocationResult result;
        result.envelope_ = dispatcher.dispatch(request);

        if (wants_image) {
            auto store = image_store_factory_(session);
            gemini::artifact::ArtifactResolver resolver(dispatcher, *store, fallback_plan_);
            result.resolution_ = resolver.resolve(request, result.envelope_, output_path);
            spdlog::debug("Image resolution tier: {}", gemini::artifact::to_string(result.resolution_->tier_));
        }

        session.close();
        return result;
    }
}  // namespace runner
