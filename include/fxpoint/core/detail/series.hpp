// include/fxpoint/core/detail/series.hpp — Integer series kernels behind the transcendental functions.

#pragma once

#include <fxpoint/core/bigint.hpp>

namespace fxpoint::core::detail {

    // Every argument and result below is a scaled integer at resolution
    // 2^bits. Loops stop once the next term rounds to zero.

    // Σ (-1)^k t^(2k+1) / (2k+1). Callers keep |t| <= tan(pi/8).
    bigint atan_series(const bigint &t, int bits);

    // Σ z^(2k+1) / (2k+1), the inverse hyperbolic tangent for |z| < 1.
    bigint atanh_series(const bigint &z, int bits);

    // Σ r^n / n!.
    bigint exp_series(const bigint &r, int bits);

    // Taylor series of sin and cos around zero, meant for |r| <= pi/4.
    bigint sin_series(const bigint &r, int bits);
    bigint cos_series(const bigint &r, int bits);

    // Square root of a non-negative scaled value, rounded to nearest.
    bigint sqrt_scaled(const bigint &value, int bits);

    // pi = 16 atan(1/5) - 4 atan(1/239)
    bigint compute_pi(int bits);
    // ln 2 = 2 atanh(1/3)
    bigint compute_ln2(int bits);
    // e = Σ 1/n!
    bigint compute_e(int bits);

} // namespace fxpoint::core::detail
