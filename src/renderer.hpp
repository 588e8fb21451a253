#pragma once

#include <vector>
#include <cstddef>
#include <cstdint>

#include "view_state.hpp"

// Row-major 8-bit pixel buffer: one byte per pixel for the rendered
// intensities, three (R, G, B) after colorizing.
struct PixelBuffer {
    std::vector<uint8_t> pixels;
    int width    = 0;
    int height   = 0;
    int channels = 1;

    void resize(int w, int h, int ch = 1)
    {
        width    = w;
        height   = h;
        channels = ch;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h)
                      * static_cast<size_t>(ch), 0);
    }
};

// Writable window onto a width x height rectangle of a PixelBuffer whose
// first pixel sits at buffer index `offset`. upper_left / lower_right are the
// plane points of the window's (0, 0) and (width, height) pixel edges.
//
// `image` is the full raster the window belongs to. Pixels are mapped with
// pixel_to_point over `image`, so a pixel's value does not depend on which
// window it was rendered in.
struct BandView {
    uint8_t*   pixels = nullptr;
    size_t     offset = 0;
    int        width  = 0;
    int        height = 0;
    PlanePoint upper_left;
    PlanePoint lower_right;
    ViewState  image;

    // Image column / row of the window's first pixel.
    int first_col() const
    {
        if (image.width < 1) return 0;
        return static_cast<int>(offset % static_cast<size_t>(image.width));
    }
    int first_row() const
    {
        if (image.width < 1) return 0;
        return static_cast<int>(offset / static_cast<size_t>(image.width));
    }
};

// Fills one band. Called concurrently from several workers, always on
// views that do not overlap.
class IBandRenderer {
public:
    virtual ~IBandRenderer() = default;
    virtual void render_band(const BandView& band) = 0;
};
