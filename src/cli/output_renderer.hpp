#ifndef GEMINI_WEB_OUTPUT_RENDERER_HPP
#define GEMINI_WEB_OUTPUT_RENDERER_HPP

#include <ostream>

#include "../gemini/artifact/artifact_resolver.hpp"
#include "../gemini/dispatch/types.hpp"

namespace cli {
    struct RenderOptions {
        bool json_output_ = false;
        bool show_thoughts_ = false;
    };

    // Results go to `out`, notes to `err`.
    class OutputRenderer {
       public:
        OutputRenderer(std::ostream& out, std::ostream& err, RenderOptions options);

        void render_text(const gemini::dispatch::ResponseEnvelope& envelope) const;
        void render_image(const gemini::artifact::ResolutionOutcome& outcome) const;

        // Text the service produced when no image could be saved.
        void render_unresolved(const gemini::artifact::ResolutionOutcome& outcome) const;

       private:
        std::ostream& out_;
        std::ostream& err_;
        RenderOptions options_;
    };
}  // namespace cli

#endif
