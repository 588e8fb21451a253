#pragma once

// AVX escape-time kernel - implementation in cpu_renderer_avx.cpp.
// Computes 4 pixels of one row at once.
// re4:   real coordinates of the 4 pixels
// im:    imaginary coordinate (same for all 4 pixels in a row)
// out4:  receives 4 escape counts (limit for points that never escape)

void avx_escape_time_4(const double* re4, double im, int limit, int* out4);
