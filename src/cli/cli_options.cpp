#include "cli_options.hpp"


namespace cli {
    namespace {
        const std::string& require_value(const std::vector<std::string>& args, size_t& i, const char* what) {
            ++i;
            if (i >= args.size()) {
                throw CliError(what);
            }
            return args[i];
        }
    }  // namespace

    const char* help_text() {
        return R"(Usage: gemini-web [OPTIONS] PROMPT

Gemini web client authenticated with browser cookies. No API key required.

Arguments:
  PROMPT                Text prompt for query/generation

Options:
  --file, -f FILE       Input file (repeatable; MP4, PDF, PNG, JPG, etc.)
  --youtube URL         YouTube video URL to analyze
  --generate-image FILE Generate image and save to FILE
  --edit IMAGE          Edit existing image (use with --output)
  --output, -o FILE     Output file path (for image generation/editing)
  --aspect RATIO        Aspect ratio for image generation (16:9, 1:1, 4:3, 3:4)
  --show-thoughts       Display model's thinking process
  --model MODEL         Model to use (default: gemini-3.0-pro)
  --json                Output response as JSON
  --verbose             Log protocol details to stderr
  --help, -h            Show this help message

Environment:
  ORACLE_GEMINI_COOKIES_JSON        JSON object of cookie name to value
  ORACLE_GEMINI_SECURE_1PSID        __Secure-1PSID cookie value
  ORACLE_GEMINI_SECURE_1PSIDTS      __Secure-1PSIDTS cookie value
  ORACLE_GEMINI_PROXY               Proxy URL for every request
  ORACLE_GEMINI_TIMEOUT_S           Request timeout in seconds (default: 120)
  ORACLE_GEMINI_AUTO_REFRESH        Rotate __Secure-1PSIDTS periodically (default: on)
  ORACLE_GEMINI_REFRESH_INTERVAL_S  Rotation interval in seconds (default: 540)
  ORACLE_GEMINI_VERIFY_TLS          Verify TLS certificates (default: on)

Examples:
  gemini-web "Explain quantum computing"
  gemini-web "Summarize this video" --file video.mp4
  gemini-web "What are the key points?" --youtube "https://youtube.com/watch?v=..."
  gemini-web "A sunset over mountains" --generate-image sunset.png
  gemini-web "Make the sky purple" --edit photo.jpg --output edited.png
  gemini-web "Solve this step by step: What is 15% of 240?" --show-thoughts)";
    }

    CliOptions CliOptions::parse(int argc, char** argv) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        return parse(args);
    }

    CliOptions CliOptions::parse(const std::vector<std::string>& args) {
        CliOptions options;
        std::vector<std::string> positional;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "--help" || arg == "-h") {
                options.help_requested_ = true;
                return options;
            }
            if (arg == "--file" || arg == "-f") {
                options.files_.push_back(require_value(args, i, "--file requires a path"));
            } else if (arg == "--youtube") {
                options.youtube_ = require_value(args, i, "--youtube requires a URL");
            } else if (arg == "--generate-image") {
                options.generate_image_ = require_value(args, i, "--generate-image requires an output filename");
            } else if (arg == "--edit") {
                options.edit_ = require_value(args, i, "--edit requires an input image");
            } else if (arg == "--output" || arg == "-o") {
                options.output_ = require_value(args, i, "--output requires a filename");
            } else if (arg == "--aspect") {
                options.aspect_ = require_value(args, i, "--aspect requires a ratio");
            } else if (arg == "--model") {
                options.model_ = require_value(args, i, "--model requires a model name");
            } else if (arg == "--show-thoughts") {
                options.show_thoughts_ = true;
            } else if (arg == "--json") {
                options.json_output_ = true;
            } else if (arg == "--verbose") {
                options.verbose_ = true;
            } else if (arg.empty() || arg.front() != '-') {
                positional.push_back(arg);
            } else {
                throw CliError("Unknown option " + arg);
            }
        }

        if (positional.empty()) {
            throw CliError("PROMPT is required\nUse --help for usage information");
        }

        for (const auto& word : positional) {
            if (!options.prompt_.empty()) {
                options.prompt_ += ' ';
            }
            options.prompt_ += word;
        }
        return options;
    }

    bool CliOptions::wants_image() const { return generate_image_.has_value() || edit_.has_value(); }

    std::filesystem::path CliOptions::output_path() const {
        if (generate_image_) {
            return *generate_image_;
        }
        if (output_) {
            return *output_;
        }
        return constants::DEFAULT_OUTPUT_FILE;
    }

    std::string CliOptions::decorated_prompt() const {
        std::string prompt = prompt_;
        if (aspect_ && wants_image()) {
            prompt += " (aspect ratio: " + *aspect_ + ")";
        }
        if (youtube_) {
            prompt += "\n\nYouTube video: " + *youtube_;
        }
        if (generate_image_ && !edit_) {
            prompt = "Generate an image: " + prompt;
        }
        return prompt;
    }

    gemini::dispatch::Request CliOptions::to_request() const {
        gemini::dispatch::Request request;
        request.prompt_ = decorated_prompt();
        request.model_ = model_;

        for (const auto& file : files_) {
            if (!std::filesystem::exists(file)) {
                throw CliError("File not found: " + file);
            }
            request.attachments_.emplace_back(file);
        }

        if (edit_) {
            if (!std::filesystem::exists(*edit_)) {
                throw CliError("Image not found: " + *edit_);
            }
            request.edit_base_ = std::filesystem::path(*edit_);
        }

        return request;
    }
}  // namespace cli
