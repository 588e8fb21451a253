#include "cpu_renderer.hpp"
#include "cpu_renderer_avx.hpp"
#include "fractal.hpp"

#include <thread>

// -----------------------------------------------------------------------
// Constructor - detect AVX, pick thread count
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
{
    avx_supported = __builtin_cpu_supports("avx");
    use_avx       = avx_supported;
    avx_active    = use_avx;

    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    thread_count = n;
}

// -----------------------------------------------------------------------
// Band renderer - called from worker threads on disjoint views
// -----------------------------------------------------------------------
void CpuRenderer::render_band(const BandView& band)
{
    const ViewState& img = band.image;
    const int W    = band.width;
    const int H    = band.height;
    const int col0 = band.first_col();
    const int row0 = band.first_row();

    for (int py = 0; py < H; ++py) {
        uint8_t* row = band.pixels + static_cast<size_t>(py) * W;
        const int y  = row0 + py;
        const double im = pixel_to_point(img.width, img.height, col0, y,
                                         img.upper_left, img.lower_right).im;
        int px = 0;

        // --- AVX path: 4 pixels per iteration ---
        if (use_avx) {
            for (; px + 4 <= W; px += 4) {
                double re4[4];
                int    count4[4];
                for (int k = 0; k < 4; ++k)
                    re4[k] = pixel_to_point(img.width, img.height, col0 + px + k, y,
                                            img.upper_left, img.lower_right).re;
                avx_escape_time_4(re4, im, ESCAPE_LIMIT, count4);
                for (int k = 0; k < 4; ++k)
                    row[px + k] = intensity_for(count4[k]);
            }
        }

        // --- Scalar path: remainder pixels (or full row if no AVX) ---
        for (; px < W; ++px) {
            const PlanePoint c = pixel_to_point(img.width, img.height, col0 + px, y,
                                                img.upper_left, img.lower_right);
            row[px] = intensity_for(escape_time(c, ESCAPE_LIMIT));
        }
    }
}

// -----------------------------------------------------------------------
// Top-level render - hands the buffer to a WorkQueue-driven thread group
// -----------------------------------------------------------------------
void CpuRenderer::render(const ViewState& vs, PixelBuffer& buf)
{
    const size_t chunk = static_cast<size_t>(rows_per_band)
                       * static_cast<size_t>(vs.width > 0 ? vs.width : 1);

    last_report    = render_parallel(vs, buf, *this, thread_count, chunk);
    last_render_ms = last_report.ms;
}
