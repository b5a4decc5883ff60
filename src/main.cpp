#include "animation.hpp"
#include "config.hpp"
#include "export.hpp"
#include "render_error.hpp"

#include <cstdio>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    try {
        const ArgSpec args = parse_args(argc, argv);
        if (args.show_help) {
            print_help(argv[0]);
            return 0;
        }
        const RenderConfig& cfg = args.config;

        std::string err;
        std::unique_ptr<FrameSink> sink = make_frame_sink(
            cfg.format, cfg.output, cfg.image_width, cfg.image_height, err);
        if (!sink)
            throw ConfigError("format", err);

        render_animation(cfg, *sink);
    } catch (const ConfigError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        fprintf(stderr, "Run with --help for usage.\n");
        return 1;
    } catch (const std::exception& e) {   // EncoderError, WorkerError, I/O
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
