#pragma once

#include "renderer.hpp"
#include "render_worker.hpp"
#include "view_state.hpp"

class CpuRenderer : public IBandRenderer {
public:
    CpuRenderer();

    // Renders vs into buf (one byte per pixel) on thread_count workers.
    // Rethrows the first worker fault after all workers have joined.
    void render(const ViewState& vs, PixelBuffer& buf);

    void render_band(const BandView& band) override;

    double       last_render_ms = 0.0;
    RenderReport last_report;
    bool         avx_active     = false;   // true if AVX path is in use
    int          thread_count   = 0;
    int          hw_concurrency = 0;       // logical CPU count detected at startup
    int          rows_per_band  = 8;

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

    // n<1 is clamped to one row
    void set_rows_per_band(int n) { rows_per_band = n < 1 ? 1 : n; }

    // Override AVX flag (e.g. for benchmarking scalar path). Ignored when
    // the CPU has no AVX.
    void set_avx(bool b) { use_avx = b && avx_supported; avx_active = use_avx; }

private:
    bool avx_supported = false;
    bool use_avx       = false;
};
