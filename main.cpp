#include <spdlog/spdlog.h>

#include <iostream>

#include "src/cli/cli_options.hpp"
#include "src/cli/output_renderer.hpp"
#include "src/config/client_config.hpp"
#include "src/gemini/error/gemini_error.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/logging/logger.hpp"
#include "src/runner/invocation.hpp"

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        const auto options = cli::CliOptions::parse(argc, argv);
        if (options.help_requested_) {
            std::cout << cli::help_text() << std::endl;
            return runner::EXIT_OK;
        }

        logging::init(options.verbose_);

        const auto request = options.to_request();
        auto client_config = config::ClientConfig::from_environment();

        http::client::CurlGlobal curl_global;
        spdlog::debug("Using {}", http::client::CurlGlobal::version());

        auto invocation = runner::InvocationBuilder()
                              .with_http_client_factory([](const http::client::TransportOptions& transport_options) {
                                  return std::make_unique<http::client::CurlEasy>(transport_options);
                              })
                              .with_config(std::move(client_config))
                              .validate()
                              .build();

        //
        // Run
        //

        const auto result = invocation->run(request, options.wants_image(), options.output_path());

        //
        // Report
        //

        const cli::OutputRenderer renderer(std::cout, std::cerr,
                                           cli::RenderOptions{.json_output_ = options.json_output_, .show_thoughts_ = options.show_thoughts_});
        if (!result.resolution_) {
            renderer.render_text(result.envelope_);
        } else if (result.resolution_->resolved()) {
            renderer.render_image(*result.resolution_);
        } else {
            renderer.render_unresolved(*result.resolution_);
        }
        return result.exit_code();
    } catch (const cli::CliError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return runner::EXIT_FAILURE_CODE;
    } catch (const http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return runner::EXIT_FAILURE_CODE;
    } catch (const gemini::gemini_error::GeminiError& e) {
        spdlog::debug("Failure category: {}", gemini::gemini_error::to_string(e.category_));
        std::cerr << "Error: " << e.what() << std::endl;
        return runner::EXIT_FAILURE_CODE;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return runner::EXIT_FAILURE_CODE;
    }
}
