// include/fxpoint/core/detail/rounding.hpp — Round-half-away-from-zero helpers on scaled bigints.

#pragma once

#include <cstddef>

#include <fxpoint/core/bigint.hpp>

namespace fxpoint::core::detail {

    // value / 2^count, ties rounded away from zero.
    inline bigint round_shift_right(const bigint &value, std::size_t count) {
        if (count == 0 || value.is_zero()) {
            return value;
        }
        bigint result = value.truncate_shift_right(count);
        if (value.test_bit(count - 1)) {
            result += value.is_negative() ? -bigint::one() : bigint::one();
        }
        return result;
    }

    // Moves a scaled value from 2^from_bits to 2^to_bits resolution. Widening
    // is exact; narrowing rounds once.
    inline bigint rescale(const bigint &value, long long from_bits, long long to_bits) {
        if (to_bits >= from_bits) {
            return value.shift_left(static_cast<std::size_t>(to_bits - from_bits));
        }
        return round_shift_right(value, static_cast<std::size_t>(from_bits - to_bits));
    }

    // numerator / denominator, ties rounded away from zero.
    inline bigint round_div(const bigint &numerator, const bigint &denominator) {
        auto [quotient, remainder] = bigint::div_mod(numerator.abs(), denominator.abs());
        const bigint twice_remainder = remainder.shift_left(1);
        if (twice_remainder >= denominator.abs()) {
            quotient += bigint::one();
        }
        if (numerator.is_negative() != denominator.is_negative()) {
            quotient = -quotient;
        }
        return quotient;
    }

    // Fixed-point product at the shared resolution 2^bits.
    inline bigint mul_scaled(const bigint &lhs, const bigint &rhs, std::size_t bits) {
        return round_shift_right(lhs * rhs, bits);
    }

    // Fixed-point quotient at the shared resolution 2^bits.
    inline bigint div_scaled(const bigint &lhs, const bigint &rhs, std::size_t bits) {
        return round_div(lhs.shift_left(bits), rhs);
    }

} // namespace fxpoint::core::detail
