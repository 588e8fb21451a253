// ============================================================================
//  minitest_render - worker loop and escape-time renderer
//
//   [A] pixel_to_point / escape_time / intensity_for on known values
//   [B] coverage: a stamping renderer sees every pixel exactly once, always
//       inside the range that was claimed, for aligned and unaligned chunks
//   [C] 1 thread and 8 threads produce byte-identical images; the scalar
//       and AVX paths agree; known all-escaped and all-interior views;
//       any band size matches the direct per-pixel evaluation
//   [D] a renderer fault is reported by render_parallel after the join
//
//  Run: ./minitest_render  (exit status 0 when all pass)
// ============================================================================

#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "render_worker.hpp"

#include <atomic>
#include <cmath>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::fprintf(stderr, "[FAIL] %s:%d -> %s\n", __FUNCTION__, __LINE__, #expr); return false; } }while(0)

// Marks each pixel with the ordinal of the range that covers it and counts
// how often each buffer index is written.
class StampRenderer : public IBandRenderer {
public:
    StampRenderer(const ViewState& vs, size_t chunk)
        : view(vs)
        , chunk(chunk)
        , hits(new std::atomic<int>[static_cast<size_t>(vs.width) * vs.height])
        , total(static_cast<size_t>(vs.width) * vs.height)
    {
        for (size_t i = 0; i < total; ++i) hits[i].store(0);
    }

    void render_band(const BandView& band) override
    {
        const size_t n = static_cast<size_t>(band.width) * band.height;
        if (band.offset + n > total) { bad_geometry = true; return; }

        // Every piece stays inside one claimed range.
        const size_t range = band.offset / chunk;
        if ((band.offset + n - 1) / chunk != range) bad_geometry = true;

        // Pieces are rectangles of the full image.
        const int col = static_cast<int>(band.offset % view.width);
        const int row = static_cast<int>(band.offset / view.width);
        if (band.height > 1 && col != 0) bad_geometry = true;
        if (col + band.width > view.width) bad_geometry = true;
        const PlanePoint ul = pixel_to_point(view.width, view.height, col, row,
                                             view.upper_left, view.lower_right);
        if (ul.re != band.upper_left.re || ul.im != band.upper_left.im)
            bad_geometry = true;

        for (size_t i = 0; i < n; ++i) {
            band.pixels[i] = static_cast<uint8_t>(range % 251 + 1);
            hits[band.offset + i].fetch_add(1);
        }
    }

    ViewState                           view;
    size_t                              chunk;
    std::unique_ptr<std::atomic<int>[]> hits;
    size_t                              total;
    std::atomic<bool>                   bad_geometry{false};
};

// Throws once it is asked to render the band containing buffer index `at`.
class FaultyRenderer : public IBandRenderer {
public:
    explicit FaultyRenderer(size_t at) : at(at) {}

    void render_band(const BandView& band) override
    {
        const size_t n = static_cast<size_t>(band.width) * band.height;
        if (band.offset <= at && at < band.offset + n)
            throw std::runtime_error("band at " + std::to_string(band.offset) + " failed");
        for (size_t i = 0; i < n; ++i) band.pixels[i] = 1;
        rendered.fetch_add(n);
    }

    size_t              at;
    std::atomic<size_t> rendered{0};
};

static ViewState make_view(int w, int h)
{
    ViewState vs;
    vs.width       = w;
    vs.height      = h;
    vs.upper_left  = {-2.2,  1.2};
    vs.lower_right = { 1.0, -1.2};
    return vs;
}

// ------------------ TEST A : collaborators ----------------------------------
static bool test_pixel_to_point()
{
    const PlanePoint p = pixel_to_point(100, 200, 25, 175, {-1.0, 1.0}, {1.0, -1.0});
    T_ASSERT(p.re == -0.5);
    T_ASSERT(p.im == -0.75);

    const PlanePoint corner = pixel_to_point(100, 200, 0, 0, {-1.0, 1.0}, {1.0, -1.0});
    T_ASSERT(corner.re == -1.0 && corner.im == 1.0);
    return true;
}

static bool test_escape_time()
{
    T_ASSERT(escape_time(0.0, 0.0, ESCAPE_LIMIT) == ESCAPE_LIMIT);   // origin stays bounded
    T_ASSERT(escape_time(-1.0, 0.0, ESCAPE_LIMIT) == ESCAPE_LIMIT);  // period-2 cycle
    T_ASSERT(escape_time(2.0, 2.0, ESCAPE_LIMIT) == 1);              // |c|^2 = 8
    T_ASSERT(escape_time(1.0, 0.0, ESCAPE_LIMIT) == 3);              // 0, 1, 2, 5
    T_ASSERT(escape_time(1.0, 0.0, 2) == 2);                         // limit reached first

    T_ASSERT(intensity_for(ESCAPE_LIMIT) == 0);
    T_ASSERT(intensity_for(0) == 255);
    T_ASSERT(intensity_for(3) == 252);
    T_ASSERT(intensity_for(ESCAPE_LIMIT - 1) == 1);
    return true;
}

// ------------------ TEST B : coverage ---------------------------------------
static bool check_coverage(int w, int h, size_t chunk, int threads)
{
    const ViewState vs = make_view(w, h);
    StampRenderer stamp(vs, chunk);
    PixelBuffer buf;

    const RenderReport rep = render_parallel(vs, buf, stamp, threads, chunk);

    const size_t total = static_cast<size_t>(w) * h;
    T_ASSERT(!stamp.bad_geometry.load());
    T_ASSERT(buf.pixels.size() == total);
    T_ASSERT(rep.pixels == total);
    T_ASSERT(rep.ranges == (total + chunk - 1) / chunk);
    T_ASSERT(rep.workers.size() == static_cast<size_t>(threads));
    for (size_t i = 0; i < total; ++i) {
        T_ASSERT(stamp.hits[i].load() == 1);
        T_ASSERT(buf.pixels[i] == static_cast<uint8_t>((i / chunk) % 251 + 1));
    }
    return true;
}

static bool test_coverage_row_aligned()
{
    T_ASSERT(check_coverage(64, 48, 64 * 4, 1));
    T_ASSERT(check_coverage(64, 48, 64 * 4, 8));
    T_ASSERT(check_coverage(64, 48, 64 * 48, 8));    // one range, idle workers
    T_ASSERT(check_coverage(64, 48, 64 * 100, 3));   // chunk larger than the image
    return true;
}

static bool test_coverage_unaligned()
{
    T_ASSERT(check_coverage(5, 9, 7, 4));
    T_ASSERT(check_coverage(37, 23, 1, 8));
    T_ASSERT(check_coverage(37, 23, 100, 8));
    T_ASSERT(check_coverage(100, 1, 30, 8));
    T_ASSERT(check_coverage(1, 50, 3, 2));
    return true;
}

// ------------------ TEST C : CPU renderer -----------------------------------
static bool test_thread_count_invariance()
{
    const ViewState vs = make_view(240, 160);
    for (int rows : {1, 3, 160}) {
        CpuRenderer one;
        one.set_thread_count(1);
        one.set_rows_per_band(rows);
        PixelBuffer a;
        one.render(vs, a);

        CpuRenderer eight;
        eight.set_thread_count(8);
        eight.set_rows_per_band(rows);
        PixelBuffer b;
        eight.render(vs, b);

        T_ASSERT(a.pixels.size() == 240u * 160u);
        T_ASSERT(a.pixels == b.pixels);
        T_ASSERT(eight.last_report.pixels == a.pixels.size());
    }

    // Same chunk through render_parallel, chunk not a multiple of the width.
    CpuRenderer r;
    PixelBuffer c, d;
    render_parallel(vs, c, r, 1, 1000);
    render_parallel(vs, d, r, 8, 1000);
    T_ASSERT(c.pixels == d.pixels);
    return true;
}

static bool test_scalar_matches_avx()
{
    CpuRenderer r;
    if (!r.avx_active) {
        std::printf("    (no AVX on this CPU, scalar only)\n");
        return true;
    }
    const ViewState vs = make_view(203, 97);   // width not a multiple of 4
    PixelBuffer with_avx, scalar;
    r.render(vs, with_avx);
    r.set_avx(false);
    T_ASSERT(!r.avx_active);
    r.render(vs, scalar);
    T_ASSERT(with_avx.pixels == scalar.pixels);
    return true;
}

static bool test_known_views()
{
    CpuRenderer r;
    r.set_thread_count(4);
    PixelBuffer buf;

    // |c| > 2 everywhere: every point escapes on the first test after z = c.
    ViewState outside;
    outside.width       = 32;
    outside.height      = 16;
    outside.upper_left  = {2.5, 2.5};
    outside.lower_right = {3.5, 1.5};
    r.render(outside, buf);
    for (uint8_t p : buf.pixels) T_ASSERT(p == 254);

    // Well inside the main cardioid: nothing escapes.
    ViewState inside;
    inside.width       = 32;
    inside.height      = 16;
    inside.upper_left  = {-0.15,  0.05};
    inside.lower_right = {-0.05, -0.05};
    r.render(inside, buf);
    for (uint8_t p : buf.pixels) T_ASSERT(p == 0);
    return true;
}

// The rendered bytes equal a direct per-pixel evaluation when one band
// covers the whole image.
static bool test_matches_direct_evaluation()
{
    const ViewState vs = make_view(50, 40);
    CpuRenderer r;
    r.set_avx(false);

    PixelBuffer buf;
    buf.resize(vs.width, vs.height);
    BandView band;
    band.pixels      = buf.pixels.data();
    band.width       = vs.width;
    band.height      = vs.height;
    band.upper_left  = vs.upper_left;
    band.lower_right = vs.lower_right;
    band.image       = vs;
    r.render_band(band);

    for (int y = 0; y < vs.height; ++y)
        for (int x = 0; x < vs.width; ++x) {
            const PlanePoint c = pixel_to_point(vs.width, vs.height, x, y,
                                                vs.upper_left, vs.lower_right);
            T_ASSERT(buf.pixels[static_cast<size_t>(y) * vs.width + x]
                     == intensity_for(escape_time(c, ESCAPE_LIMIT)));
        }
    return true;
}

// Compares buf against the per-pixel mapping over the full image.
static bool equals_direct(const ViewState& vs, const PixelBuffer& buf)
{
    T_ASSERT(buf.pixels.size() == static_cast<size_t>(vs.width) * vs.height);
    for (int y = 0; y < vs.height; ++y)
        for (int x = 0; x < vs.width; ++x) {
            const PlanePoint c = pixel_to_point(vs.width, vs.height, x, y,
                                                vs.upper_left, vs.lower_right);
            T_ASSERT(buf.pixels[static_cast<size_t>(y) * vs.width + x]
                     == intensity_for(escape_time(c, ESCAPE_LIMIT)));
        }
    return true;
}

// Band size and thread count never change a pixel: every chunking, aligned
// or not, reproduces the direct per-pixel evaluation.
static bool test_chunk_size_invariance()
{
    ViewState vs;
    vs.width       = 1000;
    vs.height      = 750;
    vs.upper_left  = {-1.20, 0.35};
    vs.lower_right = {-1.00, 0.20};

    for (bool avx : {false, true}) {
        CpuRenderer r;
        r.set_avx(avx);
        if (avx && !r.avx_active) continue;

        for (int rows : {1, 3, 8}) {
            r.set_thread_count(rows == 3 ? 8 : 1);
            r.set_rows_per_band(rows);
            PixelBuffer buf;
            r.render(vs, buf);
            T_ASSERT(equals_direct(vs, buf));
        }

        PixelBuffer odd;
        render_parallel(vs, odd, r, 4, 2999);   // ranges start mid-row
        T_ASSERT(equals_direct(vs, odd));
    }
    return true;
}

// ------------------ TEST D : faults -----------------------------------------
static bool test_fault_surfaces()
{
    const ViewState vs = make_view(40, 40);
    FaultyRenderer faulty(40 * 20 + 5);
    PixelBuffer buf;

    std::string what;
    try {
        render_parallel(vs, buf, faulty, 4, 40);
    } catch (const std::runtime_error& e) {
        what = e.what();
    }
    T_ASSERT(what == "band at 800 failed");
    // Every other range was still rendered before the fault was reported.
    T_ASSERT(faulty.rendered.load() == 40u * 40u - 40u);
    return true;
}

static bool test_bad_arguments()
{
    const ViewState vs = make_view(10, 10);
    CpuRenderer r;
    PixelBuffer buf;

    bool threw = false;
    try { render_parallel(vs, buf, r, 0, 10); }
    catch (const std::invalid_argument&) { threw = true; }
    T_ASSERT(threw);

    threw = false;
    try { render_parallel(vs, buf, r, 2, 0); }
    catch (const std::invalid_argument&) { threw = true; }
    T_ASSERT(threw);
    return true;
}

int main()
{
    bool ok = true;

    ok &= test_pixel_to_point();
    ok &= test_escape_time();
    std::printf("[A] collaborators : %s\n", ok ? "OK" : "FAIL");

    ok &= test_coverage_row_aligned();
    ok &= test_coverage_unaligned();
    std::printf("[B] coverage : %s\n", ok ? "OK" : "FAIL");

    ok &= test_thread_count_invariance();
    ok &= test_scalar_matches_avx();
    ok &= test_known_views();
    ok &= test_matches_direct_evaluation();
    ok &= test_chunk_size_invariance();
    std::printf("[C] cpu renderer : %s\n", ok ? "OK" : "FAIL");

    ok &= test_fault_surfaces();
    ok &= test_bad_arguments();
    std::printf("[D] faults : %s\n", ok ? "OK" : "FAIL");

    std::printf("%s\n", ok ? "ALL TESTS PASSED" : "SOME TESTS FAILED");
    return ok ? 0 : 1;
}
