#pragma once

#include <cstdint>

#include "fractal.hpp"

struct PixelBuffer;

static constexpr int PALETTE_COUNT = 5;
static constexpr int LUT_SIZE      = ESCAPE_LIMIT + 1;   // one entry per escape count

enum PaletteId {
    PALETTE_GRAY    = 0,
    PALETTE_SMOOTH  = 1,
    PALETTE_FIRE    = 2,
    PALETTE_ICE     = 3,
    PALETTE_CLASSIC = 4,
};

extern const char* g_palette_names[PALETTE_COUNT];
extern uint32_t    g_palette_lut[PALETTE_COUNT][LUT_SIZE];

// Must be called once at startup before any colorizing.
void init_palettes();

// Palette index for a (case-sensitive) name, or -1.
int find_palette(const char* name);

// Map a rendered intensity back to a packed 0x00BBGGRR color.
// Intensity 0 is interior: black.
inline uint32_t palette_color(uint8_t intensity, int palette)
{
    if (intensity == 0)
        return 0x00000000u;
    const int count = 255 - intensity;
    return g_palette_lut[palette][count];
}

// Expands a one-channel intensity buffer into a three-channel RGB buffer.
void colorize(const PixelBuffer& gray, int palette, PixelBuffer& rgb);
