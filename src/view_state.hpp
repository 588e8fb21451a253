#pragma once

struct PlanePoint {
    double re = 0.0;
    double im = 0.0;
};

// Region of the complex plane mapped onto a width x height raster.
struct ViewState {
    int        width       = 0;
    int        height      = 0;
    PlanePoint upper_left  = {-1.20,  0.35};
    PlanePoint lower_right = {-1.00,  0.20};
};

// Maps pixel (col, row) of a width x height raster to the plane point it
// covers. Rows grow downwards while the imaginary axis grows upwards, hence
// the subtraction on the imaginary part.
inline PlanePoint pixel_to_point(int width, int height, int col, int row,
                                 PlanePoint upper_left, PlanePoint lower_right)
{
    const double span_re = lower_right.re - upper_left.re;
    const double span_im = upper_left.im  - lower_right.im;
    return {
        upper_left.re + col * span_re / width,
        upper_left.im - row * span_im / height,
    };
}
