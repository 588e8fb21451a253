#include "palette.hpp"
#include "renderer.hpp"

#include <algorithm>
#include <cstring>

const char* g_palette_names[PALETTE_COUNT] = {
    "gray",
    "smooth",
    "fire",
    "ice",
    "classic",
};

uint32_t g_palette_lut[PALETTE_COUNT][LUT_SIZE];

static uint32_t pack_rgb(uint8_t r, uint8_t g, uint8_t b)
{
    return (static_cast<uint32_t>(b) << 16)
         | (static_cast<uint32_t>(g) <<  8)
         |  static_cast<uint32_t>(r);
}

// ---------------------------------------------------------------------------
// Color-stop interpolation helper
// ---------------------------------------------------------------------------
struct ColorStop { float t; uint8_t r, g, b; };

static void build_lut(int pal, const ColorStop* stops, int n)
{
    uint32_t* lut = g_palette_lut[pal];
    for (int i = 0; i < LUT_SIZE; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(LUT_SIZE - 1);

        // Find the segment [stops[seg], stops[seg+1]] that contains t.
        int seg = n - 2;
        for (int s = 0; s < n - 1; ++s) {
            if (t <= stops[s + 1].t) { seg = s; break; }
        }
        const ColorStop& a = stops[seg];
        const ColorStop& b = stops[seg + 1];
        const float span = b.t - a.t;
        const float f    = (span > 0.0f) ? (t - a.t) / span : 0.0f;
        const float cf   = std::max(0.0f, std::min(1.0f, f));

        lut[i] = pack_rgb(
            static_cast<uint8_t>(a.r + cf * (static_cast<float>(b.r) - a.r)),
            static_cast<uint8_t>(a.g + cf * (static_cast<float>(b.g) - a.g)),
            static_cast<uint8_t>(a.b + cf * (static_cast<float>(b.b) - a.b)));
    }
}

// ---------------------------------------------------------------------------
// Palette definitions. Index = escape count, so entry 0 is the color of
// points that leave the disc immediately.
// ---------------------------------------------------------------------------
void init_palettes()
{
    // 0: gray - same shade the one-channel image stores
    for (int i = 0; i < LUT_SIZE; ++i) {
        const uint8_t v = static_cast<uint8_t>(255 - i);
        g_palette_lut[PALETTE_GRAY][i] = pack_rgb(v, v, v);
    }

    // 1: smooth - cubic Bernstein gradient (blue → purple → red → yellow)
    for (int i = 0; i < LUT_SIZE; ++i) {
        const float t = static_cast<float>(i) / static_cast<float>(ESCAPE_LIMIT);
        const float u = 1.0f - t;
        g_palette_lut[PALETTE_SMOOTH][i] = pack_rgb(
            static_cast<uint8_t>(9.0f  * u * t * t * t * 255.0f),
            static_cast<uint8_t>(15.0f * u * u * t * t * 255.0f),
            static_cast<uint8_t>(8.5f  * u * u * u * t * 255.0f));
    }

    // 2: fire  (black → dark-red → red → orange → yellow → white)
    {
        static const ColorStop s[] = {
            {0.000f,   0,   0,   0},
            {0.250f, 128,   0,   0},
            {0.500f, 255,   0,   0},
            {0.750f, 255, 128,   0},
            {0.875f, 255, 255,   0},
            {1.000f, 255, 255, 255},
        };
        build_lut(PALETTE_FIRE, s, 6);
    }

    // 3: ice  (black → dark-blue → blue → cyan → white)
    {
        static const ColorStop s[] = {
            {0.000f,   0,   0,   0},
            {0.250f,   0,   0, 128},
            {0.500f,   0,  64, 255},
            {0.750f,   0, 200, 255},
            {1.000f, 255, 255, 255},
        };
        build_lut(PALETTE_ICE, s, 5);
    }

    // 4: classic  (blue-gold gradient)
    {
        static const ColorStop s[] = {
            {0.0000f,   0,   7, 100},
            {0.1600f,  32, 107, 203},
            {0.4200f, 237, 255, 255},
            {0.6425f, 255, 170,   0},
            {0.8575f,   0,   2,   0},
            {1.0000f,   0,   7, 100},
        };
        build_lut(PALETTE_CLASSIC, s, 6);
    }
}

int find_palette(const char* name)
{
    for (int i = 0; i < PALETTE_COUNT; ++i)
        if (std::strcmp(name, g_palette_names[i]) == 0)
            return i;
    return -1;
}

void colorize(const PixelBuffer& gray, int palette, PixelBuffer& rgb)
{
    rgb.resize(gray.width, gray.height, 3);
    const size_t n = gray.pixels.size();
    for (size_t i = 0; i < n; ++i) {
        const uint32_t c = palette_color(gray.pixels[i], palette);
        rgb.pixels[i * 3 + 0] = static_cast<uint8_t>(c);
        rgb.pixels[i * 3 + 1] = static_cast<uint8_t>(c >>  8);
        rgb.pixels[i * 3 + 2] = static_cast<uint8_t>(c >> 16);
    }
}
