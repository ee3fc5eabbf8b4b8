#ifndef GEMINI_WEB_CLI_OPTIONS_HPP
#define GEMINI_WEB_CLI_OPTIONS_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../gemini/dispatch/types.hpp"
#include "../utils/constants.hpp"

namespace cli {
    struct CliError : public std::runtime_error {
        explicit CliError(const std::string& msg) : std::runtime_error(msg) {}
    };

    struct CliOptions {
        std::string prompt_;
        std::vector<std::string> files_;
        std::optional<std::string> youtube_;
        std::optional<std::string> generate_image_;
        std::optional<std::string> edit_;
        std::optional<std::string> output_;
        std::optional<std::string> aspect_;
        bool show_thoughts_ = false;
        std::string model_ = constants::DEFAULT_MODEL;
        bool json_output_ = false;
        bool verbose_ = false;
        bool help_requested_ = false;

        // Throws CliError on a missing option value, an unknown option or a missing prompt.
        // Stops at --help; the caller prints the help text.
        [[nodiscard]] static CliOptions parse(const std::vector<std::string>& args);
        [[nodiscard]] static CliOptions parse(int argc, char** argv);

        [[nodiscard]] bool wants_image() const;
        [[nodiscard]] std::filesystem::path output_path() const;

        // Prompt with the aspect, YouTube and generation decorations applied.
        [[nodiscard]] std::string decorated_prompt() const;

        // Checks every input file exists before anything touches the network.
        [[nodiscard]] gemini::dispatch::Request to_request() const;
    };

    [[nodiscard]] const char* help_text();
}  // namespace cli

#endif
