#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

#include "fxpoint/core/detail/rounding.hpp"
#include "fxpoint/number.hpp"

namespace fxpoint {

    namespace {

        using core::bigint;
        using core::detail::rescale;
        using core::detail::round_div;

        // Both operands moved to the finer of their two resolutions, exactly.
        struct Aligned {
            bigint lhs;
            bigint rhs;
            int bits;
        };

        Aligned align(const Number &lhs, const Number &rhs) {
            const int lhs_bits = lhs.format().fraction_bits();
            const int rhs_bits = rhs.format().fraction_bits();
            const int bits = std::max(lhs_bits, rhs_bits);
            return {rescale(lhs.scaled_value(), lhs_bits, bits),
                    rescale(rhs.scaled_value(), rhs_bits, bits),
                    bits};
        }

        Number settle(const Format &result, const bigint &value, long long bits) {
            return Number(result, rescale(value, bits, result.fraction_bits()));
        }

    } // namespace

    Number::Number(Format format, core::bigint scaled)
        : format_(std::move(format)), scaled_(std::move(scaled)) {
        format_.validate(scaled_);
    }

    Number Number::to_format(const Format &target) const {
        return target.convert(*this);
    }

    core::bigint Number::to_bigint() const {
        return scaled_.truncate_shift_right(static_cast<std::size_t>(format_.fraction_bits()));
    }

    double Number::to_double() const {
        constexpr std::size_t kept_bits = 64;
        long long exponent = -static_cast<long long>(format_.fraction_bits());
        bigint mantissa = scaled_;
        const std::size_t length = scaled_.bit_length();
        if (length > kept_bits) {
            const std::size_t dropped = length - kept_bits;
            mantissa = scaled_.truncate_shift_right(dropped);
            exponent += static_cast<long long>(dropped);
        }
        // ldexp saturates to infinity or zero well inside this clamp.
        exponent = std::clamp(exponent, -100000LL, 100000LL);
        return std::ldexp(mantissa.to_double(), static_cast<int>(exponent));
    }

    Number Number::operator-() const {
        return Number(format_, -scaled_);
    }

    Number Number::abs() const {
        return Number(format_, scaled_.abs());
    }

    Number Number::operator<<(int count) const {
        if (count < 0) {
            return *this >> -count;
        }
        return Number(format_, scaled_.shift_left(static_cast<std::size_t>(count)));
    }

    Number Number::operator>>(int count) const {
        if (count < 0) {
            return *this << -count;
        }
        return Number(format_,
                      core::detail::round_shift_right(scaled_, static_cast<std::size_t>(count)));
    }

    Number &Number::operator+=(const Number &other) {
        *this = *this + other;
        return *this;
    }

    Number &Number::operator-=(const Number &other) {
        *this = *this - other;
        return *this;
    }

    Number &Number::operator*=(const Number &other) {
        *this = *this * other;
        return *this;
    }

    Number &Number::operator/=(const Number &other) {
        *this = *this / other;
        return *this;
    }

    Number &Number::operator%=(const Number &other) {
        *this = *this % other;
        return *this;
    }

    Number add(const Number &lhs, const Number &rhs, const Format &result) {
        const Aligned aligned = align(lhs, rhs);
        return settle(result, aligned.lhs + aligned.rhs, aligned.bits);
    }

    Number sub(const Number &lhs, const Number &rhs, const Format &result) {
        const Aligned aligned = align(lhs, rhs);
        return settle(result, aligned.lhs - aligned.rhs, aligned.bits);
    }

    Number mul(const Number &lhs, const Number &rhs, const Format &result) {
        // The exact product lives at the sum of both resolutions.
        const long long bits = static_cast<long long>(lhs.format().fraction_bits()) +
                               rhs.format().fraction_bits();
        return settle(result, lhs.scaled_value() * rhs.scaled_value(), bits);
    }

    Number div(const Number &lhs, const Number &rhs, const Format &result) {
        if (rhs.is_zero()) {
            throw DivisionByZero();
        }
        // result = lhs * 2^(rhs_bits - lhs_bits + result_bits) / rhs, rounded once
        const long long shift = static_cast<long long>(rhs.format().fraction_bits()) -
                                lhs.format().fraction_bits() + result.fraction_bits();
        if (shift >= 0) {
            return Number(result, round_div(lhs.scaled_value().shift_left(static_cast<std::size_t>(shift)),
                                            rhs.scaled_value()));
        }
        return Number(result, round_div(lhs.scaled_value(),
                                        rhs.scaled_value().shift_left(static_cast<std::size_t>(-shift))));
    }

    Number mod(const Number &lhs, const Number &rhs, const Format &result) {
        if (rhs.is_zero()) {
            throw DivisionByZero();
        }
        const Aligned aligned = align(lhs, rhs);
        // truncated remainder, carrying the sign of lhs
        const bigint remainder = bigint::div_mod(aligned.lhs, aligned.rhs).second;
        return settle(result, remainder, aligned.bits);
    }

    Number operator+(const Number &lhs, const Number &rhs) {
        return add(lhs, rhs, Format::common(lhs.format(), rhs.format()));
    }

    Number operator-(const Number &lhs, const Number &rhs) {
        return sub(lhs, rhs, Format::common(lhs.format(), rhs.format()));
    }

    Number operator*(const Number &lhs, const Number &rhs) {
        return mul(lhs, rhs, Format::common(lhs.format(), rhs.format()));
    }

    Number operator/(const Number &lhs, const Number &rhs) {
        return div(lhs, rhs, Format::common(lhs.format(), rhs.format()));
    }

    Number operator%(const Number &lhs, const Number &rhs) {
        return mod(lhs, rhs, Format::common(lhs.format(), rhs.format()));
    }

    std::strong_ordering operator<=>(const Number &lhs, const Number &rhs) {
        const Aligned aligned = align(lhs, rhs);
        return aligned.lhs <=> aligned.rhs;
    }

    bool operator==(const Number &lhs, const Number &rhs) {
        return (lhs <=> rhs) == std::strong_ordering::equal;
    }

    namespace detail {

        Number scale_by_integer(const Number &value, const core::bigint &factor) {
            return Number(value.format(), value.scaled_value() * factor);
        }

        Number divide_by_integer(const Number &value, const core::bigint &divisor) {
            if (divisor.is_zero()) {
                throw DivisionByZero();
            }
            return Number(value.format(), round_div(value.scaled_value(), divisor));
        }

        std::strong_ordering compare_with_integer(const Number &value, const core::bigint &other) {
            const auto shift = static_cast<std::size_t>(value.format().fraction_bits());
            return value.scaled_value() <=> other.shift_left(shift);
        }

    } // namespace detail

    std::ostream &operator<<(std::ostream &os, const Number &value) {
        return os << value.to_decimal_string();
    }

} // namespace fxpoint
