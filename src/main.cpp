#include "cli_args.hpp"
#include "cli_benchmark.hpp"
#include "cpu_renderer.hpp"
#include "export.hpp"
#include "palette.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <string>

// Exit statuses
static const int EXIT_USAGE  = 1;   // bad arguments, nothing rendered
static const int EXIT_RENDER = 2;   // a worker failed, no image written
static const int EXIT_EXPORT = 3;   // image rendered but could not be encoded

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    std::string err;
    const auto opts = parse_args(argc, argv, err);
    if (!opts) {
        fprintf(stderr, "%s: %s\n", argv[0], err.c_str());
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (opts->help) {
        print_usage(argv[0]);
        return 0;
    }

    init_palettes();

    if (opts->benchmark) {
        try {
            return run_cli_benchmark();
        } catch (const std::exception& e) {
            fprintf(stderr, "benchmark failed: %s\n", e.what());
            return EXIT_RENDER;
        }
    }

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    CpuRenderer renderer;
    renderer.set_thread_count(opts->threads);
    renderer.set_rows_per_band(opts->rows_per_band);

    const ViewState& vs = opts->view;
    if (opts->verbose) {
        fprintf(stderr, "mandelq: %dx%d  [%g,%g] .. [%g,%g]\n",
                vs.width, vs.height,
                vs.upper_left.re, vs.upper_left.im,
                vs.lower_right.re, vs.lower_right.im);
        fprintf(stderr, "mandelq: %d threads, %d rows per band, %s path\n",
                renderer.thread_count, renderer.rows_per_band,
                renderer.avx_active ? "AVX" : "scalar");
    }

    // The buffer outlives the render call; every worker is joined inside it.
    PixelBuffer pixels;
    try {
        renderer.render(vs, pixels);
    } catch (const std::exception& e) {
        fprintf(stderr, "render failed: %s\n", e.what());
        return EXIT_RENDER;
    }

    const RenderReport& rep = renderer.last_report;
    if (opts->verbose) {
        for (size_t i = 0; i < rep.workers.size(); ++i)
            fprintf(stderr, "mandelq: worker %2zu  %6zu ranges  %10zu pixels\n",
                    i, rep.workers[i].ranges, rep.workers[i].pixels);
        fprintf(stderr, "mandelq: %zu ranges of %zu pixels rendered in %.1f ms\n",
                rep.ranges, rep.chunk, rep.ms);
    }

    const auto t1 = clock::now();
    std::string exp_msg;
    if (opts->palette == PALETTE_GRAY) {
        exp_msg = export_image(opts->output_path.c_str(), pixels);
    } else {
        PixelBuffer rgb;
        colorize(pixels, opts->palette, rgb);
        exp_msg = export_image(opts->output_path.c_str(), rgb);
    }
    if (!exp_msg.empty()) {
        fprintf(stderr, "export failed: %s\n", exp_msg.c_str());
        return EXIT_EXPORT;
    }

    const auto t2 = clock::now();
    if (opts->verbose)
        fprintf(stderr, "mandelq: encoded in %.1f ms\n",
                std::chrono::duration<double, std::milli>(t2 - t1).count());

    printf("Wrote %s (%.3f s)\n", opts->output_path.c_str(),
           std::chrono::duration<double>(t2 - t0).count());
    return 0;
}
