#pragma once

#include <cstdint>
#include "view_state.hpp"

// Iteration limit shared by every path; a count always fits one byte.
static constexpr int ESCAPE_LIMIT = 255;

// Returns the iteration at which |z|^2 first exceeds 4 under z = z^2 + c,
// starting from z = 0, or `limit` when the point never escapes.
//
// The update is spelled out as mul/sub/add in the same order as the AVX
// kernel so both paths agree bit for bit.
inline int escape_time(double c_re, double c_im, int limit)
{
    double zr = 0.0;
    double zi = 0.0;
    for (int i = 0; i < limit; ++i) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        if (zr2 + zi2 > 4.0)
            return i;
        const double new_zr = (zr2 - zi2) + c_re;
        const double new_zi = (zr*zi + zi*zr) + c_im;
        zr = new_zr;
        zi = new_zi;
    }
    return limit;
}

inline int escape_time(PlanePoint c, int limit)
    { return escape_time(c.re, c.im, limit); }

// 255 - count for escaped points, 0 for points that stay bounded.
inline uint8_t intensity_for(int count, int limit = ESCAPE_LIMIT)
{
    if (count >= limit) return 0;
    return static_cast<uint8_t>(255 - count);
}
