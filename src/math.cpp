#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "fxpoint/core/detail/rounding.hpp"
#include "fxpoint/core/detail/series.hpp"
#include "fxpoint/number.hpp"

namespace fxpoint {

namespace {

    using core::bigint;
    using core::detail::div_scaled;
    using core::detail::mul_scaled;
    using core::detail::rescale;
    using core::detail::round_div;
    using core::detail::round_shift_right;
    using core::detail::sqrt_scaled;

    constexpr int GUARD = DEFAULT_GUARD_BITS;
    // Resolution of the logarithm used to size pow's working precision.
    constexpr int ESTIMATE_BITS = 32;

    std::size_t to_shift(long long bits) {
        return static_cast<std::size_t>(bits);
    }

    int bit_width_of(long long value) {
        const auto magnitude = value < 0 ? 0ULL - static_cast<unsigned long long>(value)
                                         : static_cast<unsigned long long>(value);
        return static_cast<int>(std::bit_width(magnitude));
    }

    int checked_bits(long long bits) {
        if (bits > MAX_WORKING_BITS) {
            throw OverflowError("result needs more working precision than supported");
        }
        return static_cast<int>(bits);
    }

    // Saturates at +-2^62 so that callers can add small margins freely.
    long long clamp_to_long(const bigint &value) {
        constexpr long long limit = 1LL << 62;
        if (value.bit_length() > 62) {
            return value.is_negative() ? -limit : limit;
        }
        return static_cast<long long>(value);
    }

    bigint one_at(int bits) {
        return bigint::power_of_two(to_shift(bits));
    }

    // pi/2 at resolution 2^bits.
    bigint half_pi(const Format &format, int bits) {
        return round_shift_right(format.constant(Constant::pi, bits + 1), 2);
    }

    Number settle(const Format &result, const bigint &value, long long bits) {
        return Number(result, rescale(value, bits, result.fraction_bits()));
    }

    // Bits in the integer part of raw / 2^fraction_bits.
    long long integer_magnitude(const bigint &raw, long long fraction_bits) {
        return std::max(0LL, static_cast<long long>(raw.bit_length()) - fraction_bits);
    }

    // k such that x / 2^k lies in [sqrt(1/2), sqrt(2)], for x = raw / 2^fraction_bits > 0.
    long long log_exponent(const bigint &raw, int fraction_bits) {
        const std::size_t length = raw.bit_length();
        long long k = static_cast<long long>(length) - 1 - fraction_bits;
        const std::size_t dropped = length > 64 ? length - 64 : 0;
        const bigint top = raw.shift_right(dropped);
        const std::size_t top_length = length - dropped;
        if (top * top > bigint::power_of_two(2 * top_length - 1)) {
            ++k;
        }
        return k;
    }

    // ln(x / 2^k) = 2 atanh((m - 1) / (m + 1)) with m = x / 2^k.
    bigint log_mantissa(const bigint &raw, int fraction_bits, long long k, int bits) {
        const bigint m = rescale(raw, fraction_bits + k, bits);
        const bigint one = one_at(bits);
        const bigint z = div_scaled(m - one, m + one, to_shift(bits));
        return core::detail::atanh_series(z, bits).shift_left(1);
    }

    bigint ln_scaled(const bigint &raw, int fraction_bits, int bits, const Format &format) {
        const long long k = log_exponent(raw, fraction_bits);
        const int working = bits + bit_width_of(k) + 2;
        const bigint value = log_mantissa(raw, fraction_bits, k, working) +
                             format.constant(Constant::ln2, working) * bigint(k);
        return round_shift_right(value, to_shift(working - bits));
    }

    bigint log2_scaled(const bigint &raw, int fraction_bits, int bits, const Format &format) {
        const long long k = log_exponent(raw, fraction_bits);
        const bigint log_m = log_mantissa(raw, fraction_bits, k, bits);
        return bigint(k).shift_left(to_shift(bits)) +
               div_scaled(log_m, format.constant(Constant::ln2, bits), to_shift(bits));
    }

    // exp(x_raw / 2^x_bits) rounded into result.
    Number exp_to(const bigint &x_raw, long long x_bits, const Format &result) {
        if (x_raw.is_zero()) {
            return result.one();
        }
        const long long f_out = result.fraction_bits();

        // Split x = k ln2 + r with |r| <= ln2 / 2, choosing k at low resolution.
        const int coarse = checked_bits(integer_magnitude(x_raw, x_bits) + GUARD);
        const bigint k_estimate = round_div(rescale(x_raw, x_bits, coarse),
                                            result.constant(Constant::ln2, coarse));
        if (k_estimate.bit_length() > 62) {
            if (k_estimate.is_negative()) {
                return result.zero();
            }
            throw OverflowError("exponential too large to represent");
        }
        const auto k = static_cast<long long>(k_estimate);
        // exp(x) >= 2^(k - 1/2), which already exceeds the largest value.
        if (result.is_bounded() && k >= *result.integer_bits()) {
            throw OverflowError("exponential exceeds the range of " + result.to_string());
        }
        // exp(x) < 2^(k + 1/2) rounds to zero.
        if (k <= -(f_out + 2)) {
            return result.zero();
        }

        const int bits = checked_bits(f_out + GUARD + bit_width_of(k) + std::max(k, 0LL));
        const bigint x = rescale(x_raw, x_bits, bits);
        const bigint r = x - result.constant(Constant::ln2, bits) * bigint(k);
        return settle(result, core::detail::exp_series(r, bits), bits - k);
    }

    struct SinCos {
        bigint sine;
        bigint cosine;
        int bits;
    };

    SinCos sincos_scaled(const bigint &raw, int fraction_bits, const Format &result) {
        const int bits =
            checked_bits(result.fraction_bits() + GUARD + integer_magnitude(raw, fraction_bits));
        const bigint x = rescale(raw, fraction_bits, bits);
        const bigint quarter = half_pi(result, bits);
        const bigint q = round_div(x, quarter);
        const bigint r = x - q * quarter;
        const bigint s = core::detail::sin_series(r, bits);
        const bigint c = core::detail::cos_series(r, bits);

        const auto residue = static_cast<int>(bigint::div_mod_small(q.abs(), 4).second);
        const int quadrant = q.is_negative() ? (4 - residue) % 4 : residue;
        switch (quadrant) {
        case 0:
            return {s, c, bits};
        case 1:
            return {c, -s, bits};
        case 2:
            return {-s, -c, bits};
        default:
            return {-c, s, bits};
        }
    }

    bigint atan_scaled(bigint t, int bits, const Format &format) {
        if (t.is_zero()) {
            return t;
        }
        const auto shift = to_shift(bits);
        const bool negative = t.is_negative();
        t = t.abs();
        const bigint one = one_at(bits);

        // atan(t) = pi/2 - atan(1/t)
        const bool reciprocal = t > one;
        if (reciprocal) {
            t = div_scaled(one, t, shift);
        }
        // atan(t) = 2 atan(t / (1 + sqrt(1 + t^2))), applied above tan(pi/8)
        const bool halved = t * bigint(100000) > one * bigint(41421);
        if (halved) {
            const bigint root = sqrt_scaled(one + mul_scaled(t, t, shift), bits);
            t = div_scaled(root - one, t, shift);
        }

        bigint angle = core::detail::atan_series(t, bits);
        if (halved) {
            angle = angle.shift_left(1);
        }
        if (reciprocal) {
            angle = half_pi(format, bits) - angle;
        }
        return negative ? -angle : angle;
    }

    // asin(v) = atan(v / sqrt(1 - v^2)) for 0 <= v <= 1/2.
    bigint asin_small(const bigint &v, int bits, const Format &format) {
        const auto shift = to_shift(bits);
        const bigint cosine = sqrt_scaled(one_at(bits) - mul_scaled(v, v, shift), bits);
        return atan_scaled(div_scaled(v, cosine, shift), bits, format);
    }

    bigint asin_scaled(const bigint &x, int bits, const Format &format) {
        const bool negative = x.is_negative();
        const bigint v = x.abs();
        bigint angle;
        if (v <= one_at(bits - 1)) {
            angle = asin_small(v, bits, format);
        } else {
            // asin(v) = pi/2 - 2 asin(sqrt((1 - v) / 2)); 1 - v at 2^bits is
            // (1 - v) / 2 at 2^(bits + 1) exactly.
            const bigint w = round_shift_right(sqrt_scaled(one_at(bits) - v, bits + 1), 1);
            angle = half_pi(format, bits) - asin_small(w, bits, format).shift_left(1);
        }
        return negative ? -angle : angle;
    }

    void check_unit_interval(const Number &value, const char *name) {
        const bigint one = one_at(value.format().fraction_bits());
        if (value.scaled_value().abs() > one) {
            throw DomainError(std::string(name) + " argument outside [-1, 1]");
        }
    }

    Number integer_power(const Number &base, const bigint &exponent, const Format &result) {
        if (exponent.is_zero()) {
            if (base.is_zero()) {
                throw DomainError("zero raised to the power zero");
            }
            return result.one();
        }
        if (base.is_zero()) {
            if (exponent.is_negative()) {
                throw DomainError("zero raised to a negative power");
            }
            return result.zero();
        }

        const int f_in = base.format().fraction_bits();
        const long long f_out = result.fraction_bits();
        const bool reciprocal = exponent.is_negative();
        const bigint count = exponent.abs();

        // log2 |base|^count, good to slack bits
        const bigint log_base = log2_scaled(base.scaled_value().abs(), f_in, ESTIMATE_BITS, result);
        const long long power_bits = clamp_to_long((log_base * count).shift_right(ESTIMATE_BITS));
        const long long slack =
            2 + std::max(0LL, static_cast<long long>(count.bit_length()) - (ESTIMATE_BITS - 4));
        const long long result_bits = reciprocal ? -power_bits : power_bits;
        if (result.is_bounded() && result_bits - slack >= *result.integer_bits() - 1) {
            throw OverflowError("power exceeds the range of " + result.to_string());
        }
        if (result_bits + slack < -(f_out + 1)) {
            return result.zero();
        }

        // Squaring loses about one unit per step; large powers also need room
        // above the point, and reciprocals of small powers need it twice.
        const long long extra = reciprocal ? 2 * std::max(0LL, slack - power_bits)
                                           : std::max(0LL, power_bits + slack);
        const int bits = checked_bits(std::max<long long>(
            f_in, f_out + GUARD + static_cast<long long>(count.bit_length()) + extra));
        const auto shift = to_shift(bits);

        bigint square = rescale(base.scaled_value(), f_in, bits);
        bigint power = one_at(bits);
        const std::size_t length = count.bit_length();
        for (std::size_t index = 0; index < length; ++index) {
            if (count.test_bit(index)) {
                power = mul_scaled(power, square, shift);
            }
            if (index + 1 < length) {
                square = mul_scaled(square, square, shift);
            }
        }
        if (reciprocal) {
            if (power.is_zero()) {
                throw OverflowError("power exceeds the working precision");
            }
            power = div_scaled(one_at(bits), power, shift);
        }
        return settle(result, power, bits);
    }

} // namespace

Number Number::sqrt() const {
    return sqrt(format_);
}

// Rounded once: the result is round(sqrt(scaled * 2^(2 f_out - f_in))).
Number Number::sqrt(const Format &result) const {
    if (signum() < 0) {
        throw DomainError("square root of a negative number");
    }
    const long long shift = 2 * static_cast<long long>(result.fraction_bits()) - format_.fraction_bits();
    if (shift >= 0) {
        return Number(result, sqrt_scaled(scaled_, checked_bits(shift)));
    }
    // floor(sqrt(floor(v))) == floor(sqrt(v)); round up when 4 scaled >= (2 root + 1)^2 2^drop
    const auto drop = to_shift(-shift);
    bigint root = bigint::isqrt(scaled_.shift_right(drop));
    const bigint midpoint = root.shift_left(1) + bigint::one();
    if (scaled_.shift_left(2) >= (midpoint * midpoint).shift_left(drop)) {
        root += bigint::one();
    }
    return Number(result, std::move(root));
}

Number Number::ln() const {
    return ln(format_);
}

Number Number::ln(const Format &result) const {
    if (signum() <= 0) {
        throw DomainError("logarithm of a non-positive number");
    }
    const int bits = result.fraction_bits() + GUARD;
    return settle(result, ln_scaled(scaled_, format_.fraction_bits(), bits, result), bits);
}

Number Number::log2() const {
    return log2(format_);
}

Number Number::log2(const Format &result) const {
    if (signum() <= 0) {
        throw DomainError("logarithm of a non-positive number");
    }
    const int bits = result.fraction_bits() + GUARD;
    return settle(result, log2_scaled(scaled_, format_.fraction_bits(), bits, result), bits);
}

Number Number::exp() const {
    return exp(format_);
}

Number Number::exp(const Format &result) const {
    return exp_to(scaled_, format_.fraction_bits(), result);
}

Number Number::sin() const {
    return sin(format_);
}

Number Number::sin(const Format &result) const {
    const SinCos values = sincos_scaled(scaled_, format_.fraction_bits(), result);
    return settle(result, values.sine, values.bits);
}

Number Number::cos() const {
    return cos(format_);
}

Number Number::cos(const Format &result) const {
    const SinCos values = sincos_scaled(scaled_, format_.fraction_bits(), result);
    return settle(result, values.cosine, values.bits);
}

std::pair<Number, Number> Number::sincos() const {
    return sincos(format_);
}

std::pair<Number, Number> Number::sincos(const Format &result) const {
    const SinCos values = sincos_scaled(scaled_, format_.fraction_bits(), result);
    return {settle(result, values.sine, values.bits), settle(result, values.cosine, values.bits)};
}

Number Number::tan() const {
    return tan(format_);
}

Number Number::tan(const Format &result) const {
    const SinCos values = sincos_scaled(scaled_, format_.fraction_bits(), result);
    if (values.cosine.is_zero()) {
        throw DivisionByZero("tangent at a zero of cosine");
    }
    return settle(result, div_scaled(values.sine, values.cosine, to_shift(values.bits)), values.bits);
}

Number Number::asin() const {
    return asin(format_);
}

Number Number::asin(const Format &result) const {
    check_unit_interval(*this, "asin");
    const int f_in = format_.fraction_bits();
    const int bits = std::max(result.fraction_bits(), f_in) + GUARD;
    return settle(result, asin_scaled(rescale(scaled_, f_in, bits), bits, result), bits);
}

Number Number::acos() const {
    return acos(format_);
}

Number Number::acos(const Format &result) const {
    check_unit_interval(*this, "acos");
    const int f_in = format_.fraction_bits();
    const int bits = std::max(result.fraction_bits(), f_in) + GUARD;
    const bigint angle = half_pi(result, bits) - asin_scaled(rescale(scaled_, f_in, bits), bits, result);
    return settle(result, angle, bits);
}

Number Number::atan() const {
    return atan(format_);
}

Number Number::atan(const Format &result) const {
    const int bits = result.fraction_bits() + GUARD;
    return settle(result, atan_scaled(rescale(scaled_, format_.fraction_bits(), bits), bits, result), bits);
}

Number Number::pow(long long exponent) const {
    return pow(exponent, format_);
}

Number Number::pow(long long exponent, const Format &result) const {
    return integer_power(*this, bigint(exponent), result);
}

Number Number::pow(const Number &exponent) const {
    return pow(exponent, format_);
}

// Integer exponents go through repeated squaring; anything else is
// exp(y ln b), which needs a positive base.
Number Number::pow(const Number &exponent, const Format &result) const {
    if (exponent.is_integer()) {
        return integer_power(*this, exponent.to_bigint(), result);
    }
    if (is_zero()) {
        if (exponent.signum() < 0) {
            throw DomainError("zero raised to a negative power");
        }
        return result.zero();
    }
    if (signum() < 0) {
        throw DomainError("negative base with a non-integer exponent");
    }

    const int f_in = format_.fraction_bits();
    const int f_y = exponent.format().fraction_bits();
    const long long f_out = result.fraction_bits();

    // log2 of the result, y log2 b, at low resolution
    const bigint log_base = log2_scaled(scaled_, f_in, ESTIMATE_BITS, result);
    const bigint y_coarse = rescale(exponent.scaled_value(), f_y, ESTIMATE_BITS);
    const long long magnitude =
        clamp_to_long(mul_scaled(y_coarse, log_base, ESTIMATE_BITS).shift_right(ESTIMATE_BITS));
    const long long y_bits = integer_magnitude(exponent.scaled_value(), f_y);
    const long long slack = 2 + std::max(0LL, y_bits - (ESTIMATE_BITS - 4));
    if (result.is_bounded() && magnitude - slack >= *result.integer_bits() - 1) {
        throw OverflowError("power exceeds the range of " + result.to_string());
    }
    if (magnitude + slack < -(f_out + 1)) {
        return result.zero();
    }

    // Errors in y ln b scale the result by the same relative amount.
    const int bits = checked_bits(f_out + GUARD + std::max(0LL, magnitude + slack) + y_bits + 2);
    const bigint log_b = ln_scaled(scaled_, f_in, bits, result);
    const bigint y = rescale(exponent.scaled_value(), f_y, bits);
    return exp_to(mul_scaled(y, log_b, to_shift(bits)), bits, result);
}

} // namespace fxpoint
