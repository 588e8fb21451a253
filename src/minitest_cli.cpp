// ============================================================================
//  minitest_cli - argument parsing, palettes and image export
//
//   [A] parse_pair / parse_point on well-formed and malformed text
//   [B] parse_args: positional arguments, options, usage errors
//   [C] palettes: lookup by name, colorize keeps interior black
//   [D] export_png writes a readable gray / RGB PNG; failures are reported;
//       with libjxl, .jxl paths produce a JPEG XL file
//
//  Run: ./minitest_cli  (exit status 0 when all pass)
// ============================================================================

#include "cli_args.hpp"
#include "export.hpp"
#include "palette.hpp"

#include <png.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::fprintf(stderr, "[FAIL] %s:%d -> %s\n", __FUNCTION__, __LINE__, #expr); return false; } }while(0)

// ------------------ TEST A : pairs ------------------------------------------
static bool test_parse_pair()
{
    T_ASSERT(!parse_pair<int>("",        ','));
    T_ASSERT(!parse_pair<int>("10,",     ','));
    T_ASSERT(!parse_pair<int>(",10",     ','));
    T_ASSERT(!parse_pair<int>("10,20xy", ','));
    T_ASSERT(!parse_pair<int>(" 10,20",  ','));
    T_ASSERT(!parse_pair<double>("0.5x", 'x'));

    const auto a = parse_pair<int>("10,20", ',');
    T_ASSERT(a && a->first == 10 && a->second == 20);

    const auto b = parse_pair<double>("0.5x1.5", 'x');
    T_ASSERT(b && b->first == 0.5 && b->second == 1.5);

    const auto c = parse_pair<int>("1000x750", 'x');
    T_ASSERT(c && c->first == 1000 && c->second == 750);
    return true;
}

static bool test_parse_point()
{
    const auto p = parse_point("1.25,-0.0625");
    T_ASSERT(p && p->re == 1.25 && p->im == -0.0625);

    T_ASSERT(!parse_point(",-0.0625"));
    T_ASSERT(!parse_point("1.25"));
    T_ASSERT(!parse_point("nan,0"));
    T_ASSERT(!parse_point("0,inf"));
    T_ASSERT(!parse_point("1e999,0"));
    T_ASSERT(!parse_point("0,-1e400"));

    // Tiny values round towards zero instead of being rejected.
    const auto tiny = parse_point("1e-400,-1e-320");
    T_ASSERT(tiny && tiny->re == 0.0);
    T_ASSERT(tiny->im < 0.0 && tiny->im > -1e-300);
    return true;
}

// ------------------ TEST B : argv -------------------------------------------
static std::optional<CliOptions> parse(const std::vector<const char*>& args,
                                       std::string& err)
{
    std::vector<const char*> argv = {"mandelq"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parse_args(static_cast<int>(argv.size()), argv.data(), err);
}

static bool test_parse_args_ok()
{
    std::string err;
    const auto o = parse({"mandel.png", "1000x750", "-1.20,0.35", "-1,0.20"}, err);
    T_ASSERT(o);
    T_ASSERT(o->output_path == "mandel.png");
    T_ASSERT(o->view.width == 1000 && o->view.height == 750);
    T_ASSERT(o->view.upper_left.re == -1.20 && o->view.upper_left.im == 0.35);
    T_ASSERT(o->view.lower_right.re == -1.0 && o->view.lower_right.im == 0.20);
    T_ASSERT(o->threads == 0);
    T_ASSERT(o->rows_per_band == 8);
    T_ASSERT(o->palette == PALETTE_GRAY);
    T_ASSERT(!o->verbose && !o->benchmark && !o->help);

    const auto v = parse({"--threads", "3", "out.png", "--rows-per-band", "16",
                          "64x48", "-2,1", "1,-1", "--palette", "fire", "--verbose"}, err);
    T_ASSERT(v);
    T_ASSERT(v->threads == 3);
    T_ASSERT(v->rows_per_band == 16);
    T_ASSERT(v->palette == PALETTE_FIRE);
    T_ASSERT(v->verbose);
    T_ASSERT(v->output_path == "out.png");

    const auto b = parse({"--benchmark"}, err);
    T_ASSERT(b && b->benchmark);

    const auto h = parse({"--help"}, err);
    T_ASSERT(h && h->help);
    return true;
}

static bool test_parse_args_errors()
{
    const std::vector<std::vector<const char*>> bad = {
        {},
        {"out.png", "10x10", "0,0"},
        {"out.png", "10x10", "0,0", "1,1", "extra"},
        {"out.png", "10y10", "0,0", "1,1"},
        {"out.png", "0x10",  "0,0", "1,1"},
        {"out.png", "-5x10", "0,0", "1,1"},
        {"out.png", "10x10", "0;0", "1,1"},
        {"out.png", "10x10", "0,0", "1,"},
        {"out.png", "10x10", "0,0", "1,1", "--threads"},
        {"out.png", "10x10", "0,0", "1,1", "--threads", "0"},
        {"out.png", "10x10", "0,0", "1,1", "--threads", "two"},
        {"out.png", "10x10", "0,0", "1,1", "--rows-per-band", "-1"},
        {"out.png", "10x10", "0,0", "1,1", "--palette", "neon"},
        {"out.png", "10x10", "0,0", "1,1", "--frobnicate"},
        {"--benchmark", "out.png"},
    };
    for (const auto& args : bad) {
        std::string err;
        T_ASSERT(!parse(args, err));
        T_ASSERT(!err.empty());
    }
    return true;
}

// ------------------ TEST C : palettes ---------------------------------------
static bool test_palettes()
{
    init_palettes();
    T_ASSERT(find_palette("gray")    == PALETTE_GRAY);
    T_ASSERT(find_palette("smooth")  == PALETTE_SMOOTH);
    T_ASSERT(find_palette("classic") == PALETTE_CLASSIC);
    T_ASSERT(find_palette("Gray")    == -1);

    // gray palette reproduces the one-channel intensity
    for (int v = 1; v < 256; ++v) {
        const uint32_t c = palette_color(static_cast<uint8_t>(v), PALETTE_GRAY);
        T_ASSERT(c == (static_cast<uint32_t>(v) * 0x010101u));
    }

    PixelBuffer gray;
    gray.resize(3, 1);
    gray.pixels = {0, 255, 128};
    PixelBuffer rgb;
    for (int pal = 0; pal < PALETTE_COUNT; ++pal) {
        colorize(gray, pal, rgb);
        T_ASSERT(rgb.channels == 3 && rgb.width == 3 && rgb.height == 1);
        T_ASSERT(rgb.pixels.size() == 9);
        T_ASSERT(rgb.pixels[0] == 0 && rgb.pixels[1] == 0 && rgb.pixels[2] == 0);
    }

    // smooth palette: count 0 (t = 0) is black as well
    const uint32_t first = g_palette_lut[PALETTE_SMOOTH][0];
    T_ASSERT(first == 0);
    return true;
}

// ------------------ TEST D : export -----------------------------------------
static std::string temp_path(const char* name)
{
    const char* dir = std::getenv("TMPDIR");
    return std::string(dir ? dir : "/tmp") + "/" + name;
}

static bool read_png(const std::string& path, png_uint_32 format,
                     int& w, int& h, std::vector<uint8_t>& out)
{
    png_image image = {};
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, path.c_str()))
        return false;
    image.format = format;
    w = static_cast<int>(image.width);
    h = static_cast<int>(image.height);
    out.resize(PNG_IMAGE_SIZE(image));
    const bool ok = png_image_finish_read(&image, nullptr, out.data(), 0, nullptr) != 0;
    png_image_free(&image);
    return ok;
}

static bool test_export_gray_png()
{
    PixelBuffer buf;
    buf.resize(7, 5);
    for (size_t i = 0; i < buf.pixels.size(); ++i)
        buf.pixels[i] = static_cast<uint8_t>(i * 7);

    const std::string path = temp_path("minitest_cli_gray.png");
    T_ASSERT(export_png(path.c_str(), buf).empty());

    int w = 0, h = 0;
    std::vector<uint8_t> back;
    T_ASSERT(read_png(path, PNG_FORMAT_GRAY, w, h, back));
    T_ASSERT(w == 7 && h == 5);
    T_ASSERT(back == buf.pixels);
    std::remove(path.c_str());
    return true;
}

static bool test_export_rgb_png()
{
    PixelBuffer buf;
    buf.resize(4, 3, 3);
    for (size_t i = 0; i < buf.pixels.size(); ++i)
        buf.pixels[i] = static_cast<uint8_t>(255 - i * 5);

    const std::string path = temp_path("minitest_cli_rgb.png");
    T_ASSERT(export_image(path.c_str(), buf).empty());

    int w = 0, h = 0;
    std::vector<uint8_t> back;
    T_ASSERT(read_png(path, PNG_FORMAT_RGB, w, h, back));
    T_ASSERT(w == 4 && h == 3);
    T_ASSERT(back == buf.pixels);
    std::remove(path.c_str());
    return true;
}

#ifdef HAVE_JXL
// Checks for the bare codestream marker or the ISO BMFF container box.
static bool has_jxl_signature(const std::string& path)
{
    FILE* fp = std::fopen(path.c_str(), "rb");
    if (!fp) return false;
    unsigned char head[12] = {};
    const size_t n = std::fread(head, 1, sizeof(head), fp);
    std::fclose(fp);

    static const unsigned char box[12] = {0x00, 0x00, 0x00, 0x0C, 'J', 'X', 'L', ' ',
                                          0x0D, 0x0A, 0x87, 0x0A};
    if (n >= 2 && head[0] == 0xFF && head[1] == 0x0A) return true;
    return n == sizeof(box) && std::memcmp(head, box, sizeof(box)) == 0;
}

static bool test_export_jxl()
{
    T_ASSERT(jxl_available());

    PixelBuffer gray;
    gray.resize(9, 6);
    for (size_t i = 0; i < gray.pixels.size(); ++i)
        gray.pixels[i] = static_cast<uint8_t>(i * 3);

    const std::string gray_path = temp_path("minitest_cli_gray.jxl");
    T_ASSERT(export_image(gray_path.c_str(), gray).empty());
    T_ASSERT(has_jxl_signature(gray_path));
    std::remove(gray_path.c_str());

    PixelBuffer rgb;
    rgb.resize(5, 4, 3);
    for (size_t i = 0; i < rgb.pixels.size(); ++i)
        rgb.pixels[i] = static_cast<uint8_t>(200 - i);

    const std::string rgb_path = temp_path("minitest_cli_rgb.jxl");
    T_ASSERT(export_image(rgb_path.c_str(), rgb).empty());
    T_ASSERT(has_jxl_signature(rgb_path));
    std::remove(rgb_path.c_str());

    T_ASSERT(!export_image("/nonexistent-dir/mandelq/out.jxl", rgb).empty());
    return true;
}
#endif

static bool test_export_failures()
{
    PixelBuffer buf;
    buf.resize(4, 4);
    T_ASSERT(!export_png("/nonexistent-dir/mandelq/out.png", buf).empty());

    PixelBuffer empty;
    T_ASSERT(!export_png(temp_path("minitest_cli_empty.png").c_str(), empty).empty());

    PixelBuffer odd;
    odd.resize(2, 2, 2);
    T_ASSERT(!export_png(temp_path("minitest_cli_odd.png").c_str(), odd).empty());

#ifndef HAVE_JXL
    T_ASSERT(!export_image(temp_path("minitest_cli.jxl").c_str(), buf).empty());
#endif
    return true;
}

int main()
{
    bool ok = true;

    ok &= test_parse_pair();
    ok &= test_parse_point();
    std::printf("[A] pairs : %s\n", ok ? "OK" : "FAIL");

    ok &= test_parse_args_ok();
    ok &= test_parse_args_errors();
    std::printf("[B] argv : %s\n", ok ? "OK" : "FAIL");

    ok &= test_palettes();
    std::printf("[C] palettes : %s\n", ok ? "OK" : "FAIL");

    ok &= test_export_gray_png();
    ok &= test_export_rgb_png();
    ok &= test_export_failures();
#ifdef HAVE_JXL
    ok &= test_export_jxl();
#endif
    std::printf("[D] export : %s\n", ok ? "OK" : "FAIL");

    std::printf("%s\n", ok ? "ALL TESTS PASSED" : "SOME TESTS FAILED");
    return ok ? 0 : 1;
}
