// Compiled with -mavx only - do NOT include from other translation units.

#include "cpu_renderer_avx.hpp"

#include <immintrin.h>

// -----------------------------------------------------------------------
// 4-lane escape time.
//
// Lane k follows exactly the scalar escape_time() sequence:
//   test |z|^2 > 4, then zr' = (zr^2 - zi^2) + cr, zi' = (zr*zi + zi*zr) + ci
// with separate mul/add/sub (no FMA), so results match the scalar path bit
// for bit. iters counts completed updates of lanes that are still active;
// at the escape test of step i a lane holds exactly i.
// -----------------------------------------------------------------------
void avx_escape_time_4(const double* re4, double im, int limit, int* out4)
{
    const __m256d cr = _mm256_loadu_pd(re4);
    const __m256d ci = _mm256_set1_pd(im);
    __m256d zr = _mm256_setzero_pd();
    __m256d zi = _mm256_setzero_pd();

    const __m256d four = _mm256_set1_pd(4.0);
    const __m256d one  = _mm256_set1_pd(1.0);

    // active: all bits set for lanes that have not yet escaped
    __m256d active = _mm256_castsi256_pd(_mm256_set1_epi64x(-1LL));
    __m256d iters  = _mm256_setzero_pd();

    for (int i = 0; i < limit; ++i) {
        const __m256d zr2  = _mm256_mul_pd(zr, zr);
        const __m256d zi2  = _mm256_mul_pd(zi, zi);
        const __m256d mag2 = _mm256_add_pd(zr2, zi2);

        // Lanes escaping this iteration (mag2 > 4 AND still active)
        const __m256d just_esc = _mm256_and_pd(
            _mm256_cmp_pd(mag2, four, _CMP_GT_OQ), active);
        active = _mm256_andnot_pd(just_esc, active);

        if (_mm256_movemask_pd(active) == 0) break;

        const __m256d new_zr = _mm256_add_pd(_mm256_sub_pd(zr2, zi2), cr);
        const __m256d new_zi = _mm256_add_pd(
            _mm256_add_pd(_mm256_mul_pd(zr, zi), _mm256_mul_pd(zi, zr)), ci);

        // Escaped lanes keep their z; only active lanes advance.
        zr = _mm256_blendv_pd(zr, new_zr, active);
        zi = _mm256_blendv_pd(zi, new_zi, active);
        iters = _mm256_add_pd(iters, _mm256_and_pd(active, one));
    }

    alignas(32) double counts[4];
    _mm256_store_pd(counts, iters);
    for (int k = 0; k < 4; ++k)
        out4[k] = static_cast<int>(counts[k]);
}
