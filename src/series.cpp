#include <cstddef>
#include <stdexcept>

#include "fxpoint/core/detail/rounding.hpp"
#include "fxpoint/core/detail/series.hpp"

namespace fxpoint::core::detail {

    namespace {

        std::size_t shift_of(int bits) {
            if (bits < 0) {
                throw std::invalid_argument("series resolution must be non-negative");
            }
            return static_cast<std::size_t>(bits);
        }

        // Σ sign^k power_k / (2k+1) with power_{k+1} = power_k * square.
        bigint odd_power_series(const bigint &x, int bits, bool alternate) {
            const std::size_t shift = shift_of(bits);
            const bigint square = mul_scaled(x, x, shift);
            bigint power = x;
            bigint sum;
            long long divisor = 1;
            bool subtract = false;
            while (true) {
                const bigint term = round_div(power, bigint(divisor));
                if (term.is_zero()) {
                    break;
                }
                if (subtract) {
                    sum -= term;
                } else {
                    sum += term;
                }
                power = mul_scaled(power, square, shift);
                divisor += 2;
                subtract = alternate && !subtract;
            }
            return sum;
        }

        // Shared body of the sine and cosine series: the first term is given
        // and each next term is -term * r^2 / ((n+1)(n+2)).
        bigint trig_series(bigint term, const bigint &r, long long n, int bits) {
            const std::size_t shift = shift_of(bits);
            const bigint square = mul_scaled(r, r, shift);
            bigint sum;
            while (!term.is_zero()) {
                sum += term;
                term = -round_div(mul_scaled(term, square, shift), bigint((n + 1) * (n + 2)));
                n += 2;
            }
            return sum;
        }

    } // namespace

    bigint atan_series(const bigint &t, int bits) {
        return odd_power_series(t, bits, true);
    }

    bigint atanh_series(const bigint &z, int bits) {
        return odd_power_series(z, bits, false);
    }

    bigint exp_series(const bigint &r, int bits) {
        const std::size_t shift = shift_of(bits);
        bigint term = bigint::power_of_two(shift);
        bigint sum;
        long long index = 1;
        while (!term.is_zero()) {
            sum += term;
            term = round_div(mul_scaled(term, r, shift), bigint(index));
            ++index;
        }
        return sum;
    }

    bigint sin_series(const bigint &r, int bits) {
        return trig_series(r, r, 1, bits);
    }

    bigint cos_series(const bigint &r, int bits) {
        return trig_series(bigint::power_of_two(shift_of(bits)), r, 0, bits);
    }

    bigint sqrt_scaled(const bigint &value, int bits) {
        if (value.is_negative()) {
            throw std::domain_error("square root of negative value");
        }
        const bigint radicand = value.shift_left(shift_of(bits));
        bigint root = bigint::isqrt(radicand);
        // round to nearest: (root + 1/2)^2 = root^2 + root + 1/4
        if (radicand - root * root > root) {
            root += bigint::one();
        }
        return root;
    }

    bigint compute_pi(int bits) {
        const bigint one = bigint::power_of_two(shift_of(bits));
        const bigint fifth = round_div(one, bigint(5));
        const bigint inverse_239 = round_div(one, bigint(239));
        return atan_series(fifth, bits) * bigint(16) - atan_series(inverse_239, bits) * bigint(4);
    }

    bigint compute_ln2(int bits) {
        const bigint one = bigint::power_of_two(shift_of(bits));
        return atanh_series(round_div(one, bigint(3)), bits).shift_left(1);
    }

    bigint compute_e(int bits) {
        return exp_series(bigint::power_of_two(shift_of(bits)), bits);
    }

} // namespace fxpoint::core::detail
