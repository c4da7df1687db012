// include/fxpoint/number.hpp — Immutable fixed-point Number bound to a Format.

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fxpoint/core/bigint.hpp>
#include <fxpoint/core/errors.hpp>
#include <fxpoint/format.hpp>

namespace fxpoint {

    // A value scaled_value / 2^fraction_bits in a given Format. Operations
    // never modify their operands; each returns a fresh Number.
    class Number {
      public:
        // Adopts a raw scaled value; throws OverflowError if it does not fit.
        Number(Format format, core::bigint scaled);

        const Format &format() const noexcept {
            return format_;
        }
        const core::bigint &scaled_value() const noexcept {
            return scaled_;
        }

        Number to_format(const Format &target) const;

        bool is_zero() const noexcept {
            return scaled_.is_zero();
        }
        int signum() const noexcept {
            return scaled_.signum();
        }
        // True when the fractional part is zero.
        bool is_integer() const noexcept {
            return scaled_.low_bits_zero(static_cast<std::size_t>(format_.fraction_bits()));
        }
        explicit operator bool() const noexcept {
            return !scaled_.is_zero();
        }

        // Integer part, truncated toward zero.
        core::bigint to_bigint() const;

        template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
        Int to_integer() const {
            try {
                return static_cast<Int>(to_bigint());
            } catch (const std::overflow_error &) {
                throw OverflowError("fixed-point value does not fit in target integer type");
            }
        }

        double to_double() const;

        Number operator-() const;
        Number operator+() const {
            return *this;
        }
        Number abs() const;

        // Multiply or divide by a power of two; right shifts round half away
        // from zero and negative counts shift the other way.
        Number operator<<(int count) const;
        Number operator>>(int count) const;

        Number &operator+=(const Number &other);
        Number &operator-=(const Number &other);
        Number &operator*=(const Number &other);
        Number &operator/=(const Number &other);
        Number &operator%=(const Number &other);

        Number sqrt() const;
        Number sqrt(const Format &result) const;
        Number ln() const;
        Number ln(const Format &result) const;
        Number log() const {
            return ln();
        }
        Number log2() const;
        Number log2(const Format &result) const;
        Number exp() const;
        Number exp(const Format &result) const;
        Number sin() const;
        Number sin(const Format &result) const;
        Number cos() const;
        Number cos(const Format &result) const;
        std::pair<Number, Number> sincos() const;
        std::pair<Number, Number> sincos(const Format &result) const;
        Number tan() const;
        Number tan(const Format &result) const;
        Number asin() const;
        Number asin(const Format &result) const;
        Number acos() const;
        Number acos(const Format &result) const;
        Number atan() const;
        Number atan(const Format &result) const;
        Number pow(const Number &exponent) const;
        Number pow(const Number &exponent, const Format &result) const;
        Number pow(long long exponent) const;
        Number pow(long long exponent, const Format &result) const;

        // Decimal text. Without digits, prints enough fractional digits to
        // recover the value and trims trailing zeros; with digits, prints
        // exactly that many.
        std::string to_decimal_string(std::optional<int> digits = std::nullopt) const;
        std::string to_binary_string(bool twos_complement = false) const;
        std::string to_octal_string(bool twos_complement = false) const;
        std::string to_hex_string(bool twos_complement = false) const;

        // Number(<scaled>, Format(<integer_bits|none>, <fraction_bits>))
        std::string to_repr() const;
        static Number from_repr(std::string_view text);

      private:
        Format format_;
        core::bigint scaled_;
    };

    Number add(const Number &lhs, const Number &rhs, const Format &result);
    Number sub(const Number &lhs, const Number &rhs, const Format &result);
    Number mul(const Number &lhs, const Number &rhs, const Format &result);
    Number div(const Number &lhs, const Number &rhs, const Format &result);
    Number mod(const Number &lhs, const Number &rhs, const Format &result);

    Number operator+(const Number &lhs, const Number &rhs);
    Number operator-(const Number &lhs, const Number &rhs);
    Number operator*(const Number &lhs, const Number &rhs);
    Number operator/(const Number &lhs, const Number &rhs);
    Number operator%(const Number &lhs, const Number &rhs);

    std::strong_ordering operator<=>(const Number &lhs, const Number &rhs);
    bool operator==(const Number &lhs, const Number &rhs);

    inline Number abs(const Number &value) {
        return value.abs();
    }

    namespace detail {

        Number scale_by_integer(const Number &value, const core::bigint &factor);
        Number divide_by_integer(const Number &value, const core::bigint &divisor);
        std::strong_ordering compare_with_integer(const Number &value, const core::bigint &other);

    } // namespace detail

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator+(const Number &lhs, Int rhs) {
        return lhs + lhs.format().from_int(rhs);
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator+(Int lhs, const Number &rhs) {
        return rhs.format().from_int(lhs) + rhs;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator-(const Number &lhs, Int rhs) {
        return lhs - lhs.format().from_int(rhs);
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator-(Int lhs, const Number &rhs) {
        return rhs.format().from_int(lhs) - rhs;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator*(const Number &lhs, Int rhs) {
        return detail::scale_by_integer(lhs, core::bigint(rhs));
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator*(Int lhs, const Number &rhs) {
        return detail::scale_by_integer(rhs, core::bigint(lhs));
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator/(const Number &lhs, Int rhs) {
        return detail::divide_by_integer(lhs, core::bigint(rhs));
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    Number operator/(Int lhs, const Number &rhs) {
        return rhs.format().from_int(lhs) / rhs;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    bool operator==(const Number &lhs, Int rhs) {
        return detail::compare_with_integer(lhs, core::bigint(rhs)) == std::strong_ordering::equal;
    }

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    std::strong_ordering operator<=>(const Number &lhs, Int rhs) {
        return detail::compare_with_integer(lhs, core::bigint(rhs));
    }

    std::ostream &operator<<(std::ostream &os, const Number &value);

    template <typename Int, typename>
    Number Format::from_int(Int value) const {
        return from_int(core::bigint(value));
    }

} // namespace fxpoint
