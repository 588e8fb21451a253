#pragma once

#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

inline int run_cli_benchmark()
{
    CpuRenderer renderer;

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    PixelBuffer buf;

    ViewState vs;
    vs.width       = W;
    vs.height      = H;
    vs.upper_left  = {-2.2,  1.2};
    vs.lower_right = { 1.0, -1.2};

    const bool has_avx = renderer.avx_active;
    const int  hw      = renderer.hw_concurrency;

    printf("mandelq CLI Benchmark\n");
    printf("%dx%d, %d iter, %d rows per band, %d runs (avg best %d)\n",
           W, H, ESCAPE_LIMIT, renderer.rows_per_band, RUNS, BEST_N);
    printf("AVX supported: %s\n\n", has_avx ? "yes" : "no");
    printf("%-10s %-10s %s\n", "Threads", "Path", "Mpix/s");
    printf("------------------------------\n");

    for (int pass = 0; pass < 2; ++pass) {
        const bool force_scalar = pass == 1;
        if (!force_scalar && !has_avx) continue;
        renderer.set_avx(!force_scalar);

        for (int t = 1; t <= hw; ++t) {
            renderer.set_thread_count(t);

            // Warm-up
            renderer.render(vs, buf);

            std::vector<double> times(RUNS);
            for (int r = 0; r < RUNS; ++r) {
                renderer.render(vs, buf);
                times[r] = renderer.last_render_ms;
            }
            std::sort(times.begin(), times.end());
            double avg_ms = 0.0;
            for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
            avg_ms /= BEST_N;
            const double mpixs = (W * H) / (avg_ms * 1000.0);

            printf("%-10d %-10s %6.2f\n", t, force_scalar ? "scalar" : "AVX", mpixs);
        }
    }

    renderer.set_avx(has_avx);  // restore
    return 0;
}
