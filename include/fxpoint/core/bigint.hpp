// include/fxpoint/core/bigint.hpp — Signed binary bigint that carries fixed-point scaled values.

#pragma once

#include <algorithm>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace fxpoint::core {

namespace detail {

    using limb_t = std::uint32_t;
    using wide_t = std::uint64_t;

    inline constexpr int LIMB_BITS = 32;
    inline constexpr wide_t LIMB_MASK = 0xFFFF'FFFFull;
    inline constexpr wide_t LIMB_RADIX = LIMB_MASK + 1;

} // namespace detail

// Sign-magnitude integer over little-endian 32-bit limbs. The magnitude is
// kept normalized (no high zero limbs) and zero is never negative.
class bigint {
public:
    using limb_type = detail::limb_t;

    bigint() noexcept = default;
    bigint(const bigint&) = default;
    bigint(bigint&&) noexcept = default;
    bigint& operator=(const bigint&) = default;
    bigint& operator=(bigint&&) noexcept = default;

    template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit bigint(Int value) {
        if (value == 0) {
            return;
        }
        std::uint64_t magnitude = 0;
        if constexpr (std::is_signed_v<Int>) {
            negative_ = (value < 0);
            magnitude = static_cast<std::uint64_t>(static_cast<std::int64_t>(value));
            if (negative_) {
                magnitude = std::uint64_t{0} - magnitude;
            }
        } else {
            magnitude = static_cast<std::uint64_t>(value);
        }
        while (magnitude != 0) {
            limbs_.push_back(static_cast<detail::limb_t>(magnitude & detail::LIMB_MASK));
            magnitude >>= detail::LIMB_BITS;
        }
    }

    static bigint zero() noexcept { return {}; }
    static bigint one() { return bigint(1); }

    static bigint power_of_two(std::size_t exponent) {
        bigint result;
        result.limbs_.assign(exponent / detail::LIMB_BITS + 1, 0);
        result.limbs_.back() = detail::limb_t{1} << (exponent % detail::LIMB_BITS);
        return result;
    }

    static bigint from_limbs(std::vector<detail::limb_t> limbs, bool negative) {
        bigint result;
        result.limbs_ = std::move(limbs);
        result.normalize();
        result.negative_ = negative && !result.is_zero();
        return result;
    }

    bool is_zero() const noexcept { return limbs_.empty(); }
    bool is_negative() const noexcept { return negative_; }
    int signum() const noexcept {
        if (is_zero()) {
            return 0;
        }
        return negative_ ? -1 : 1;
    }
    std::size_t limb_count() const noexcept { return limbs_.size(); }

    // Number of significant bits in the magnitude; zero has none.
    std::size_t bit_length() const noexcept {
        if (limbs_.empty()) {
            return 0;
        }
        return (limbs_.size() - 1) * detail::LIMB_BITS +
               static_cast<std::size_t>(std::bit_width(limbs_.back()));
    }

    bool test_bit(std::size_t index) const noexcept {
        const std::size_t limb_index = index / detail::LIMB_BITS;
        if (limb_index >= limbs_.size()) {
            return false;
        }
        return ((limbs_[limb_index] >> (index % detail::LIMB_BITS)) & 1u) != 0;
    }

    // True when the magnitude is a multiple of 2^count.
    bool low_bits_zero(std::size_t count) const noexcept {
        const std::size_t whole = count / detail::LIMB_BITS;
        for (std::size_t index = 0; index < whole && index < limbs_.size(); ++index) {
            if (limbs_[index] != 0) {
                return false;
            }
        }
        const std::size_t partial = count % detail::LIMB_BITS;
        if (partial == 0 || whole >= limbs_.size()) {
            return true;
        }
        const detail::limb_t mask = (detail::limb_t{1} << partial) - 1u;
        return (limbs_[whole] & mask) == 0;
    }

    template <typename Int,
              typename = std::enable_if_t<std::is_integral_v<Int>>>
    explicit operator Int() const {
        if (is_zero()) {
            return static_cast<Int>(0);
        }
        if (limbs_.size() > 2) {
            throw std::overflow_error("bigint does not fit in target type");
        }
        std::uint64_t magnitude = limbs_[0];
        if (limbs_.size() == 2) {
            magnitude |= static_cast<std::uint64_t>(limbs_[1]) << detail::LIMB_BITS;
        }
        if constexpr (std::is_unsigned_v<Int>) {
            if (negative_ || magnitude > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
                throw std::overflow_error("bigint does not fit in target type");
            }
            return static_cast<Int>(magnitude);
        } else {
            const std::uint64_t limit =
                static_cast<std::uint64_t>(std::numeric_limits<Int>::max()) + (negative_ ? 1u : 0u);
            if (magnitude > limit) {
                throw std::overflow_error("bigint does not fit in target type");
            }
            if (negative_) {
                return static_cast<Int>(-static_cast<std::int64_t>(magnitude - 1) - 1);
            }
            return static_cast<Int>(magnitude);
        }
    }

    double to_double() const noexcept {
        double result = 0.0;
        for (std::size_t index = limbs_.size(); index-- > 0;) {
            result = result * static_cast<double>(detail::LIMB_RADIX) +
                     static_cast<double>(limbs_[index]);
        }
        return negative_ ? -result : result;
    }

    bigint abs() const noexcept {
        bigint copy = *this;
        copy.negative_ = false;
        return copy;
    }

    friend std::strong_ordering operator<=>(const bigint& lhs, const bigint& rhs) noexcept {
        return lhs.compare(rhs);
    }

    friend bool operator==(const bigint& lhs, const bigint& rhs) noexcept {
        return lhs.compare(rhs) == std::strong_ordering::equal;
    }

    bigint& operator+=(const bigint& other) {
        if (other.is_zero()) {
            return *this;
        }
        if (is_zero()) {
            *this = other;
            return *this;
        }
        if (negative_ == other.negative_) {
            limbs_ = add_magnitude(limbs_, other.limbs_);
        } else {
            const auto magnitude_cmp = compare_magnitude(other);
            if (magnitude_cmp == std::strong_ordering::equal) {
                limbs_.clear();
                negative_ = false;
                return *this;
            }
            if (magnitude_cmp == std::strong_ordering::greater) {
                limbs_ = subtract_magnitude(limbs_, other.limbs_);
            } else {
                limbs_ = subtract_magnitude(other.limbs_, limbs_);
                negative_ = other.negative_;
            }
        }
        normalize();
        return *this;
    }

    bigint& operator-=(const bigint& other) {
        if (other.is_zero()) {
            return *this;
        }
        if (is_zero()) {
            *this = -other;
            return *this;
        }
        if (negative_ != other.negative_) {
            limbs_ = add_magnitude(limbs_, other.limbs_);
        } else {
            const auto magnitude_cmp = compare_magnitude(other);
            if (magnitude_cmp == std::strong_ordering::equal) {
                limbs_.clear();
                negative_ = false;
                return *this;
            }
            if (magnitude_cmp == std::strong_ordering::greater) {
                limbs_ = subtract_magnitude(limbs_, other.limbs_);
            } else {
                limbs_ = subtract_magnitude(other.limbs_, limbs_);
                negative_ = !negative_;
            }
        }
        normalize();
        return *this;
    }

    bigint& operator*=(const bigint& other) {
        if (is_zero() || other.is_zero()) {
            limbs_.clear();
            negative_ = false;
            return *this;
        }
        limbs_ = multiply_magnitude(limbs_, other.limbs_);
        negative_ = negative_ != other.negative_;
        normalize();
        return *this;
    }

    bigint operator-() const {
        if (is_zero()) {
            return *this;
        }
        bigint result = *this;
        result.negative_ = !result.negative_;
        return result;
    }

    bigint& operator/=(const bigint& other) {
        auto [quotient, remainder] = div_mod(*this, other);
        (void)remainder;
        *this = std::move(quotient);
        return *this;
    }

    bigint& operator%=(const bigint& other) {
        auto [quotient, remainder] = div_mod(*this, other);
        (void)quotient;
        *this = std::move(remainder);
        return *this;
    }

    friend bigint operator+(bigint lhs, const bigint& rhs) {
        lhs += rhs;
        return lhs;
    }
    friend bigint operator-(bigint lhs, const bigint& rhs) {
        lhs -= rhs;
        return lhs;
    }
    friend bigint operator*(bigint lhs, const bigint& rhs) {
        lhs *= rhs;
        return lhs;
    }
    friend bigint operator/(bigint lhs, const bigint& rhs) {
        lhs /= rhs;
        return lhs;
    }
    friend bigint operator%(bigint lhs, const bigint& rhs) {
        lhs %= rhs;
        return lhs;
    }

    // Truncating division: the quotient rounds toward zero and the remainder
    // takes the sign of the dividend.
    static std::pair<bigint, bigint> div_mod(const bigint& dividend, const bigint& divisor) {
        if (divisor.is_zero()) {
            throw std::domain_error("division by zero");
        }
        if (dividend.is_zero()) {
            return {bigint::zero(), bigint::zero()};
        }
        auto [quotient_digits, remainder_digits] =
            divide_magnitude(dividend.limbs_, divisor.limbs_);
        const bool quotient_negative = (dividend.is_negative() != divisor.is_negative());
        return {from_limbs(std::move(quotient_digits), quotient_negative),
                from_limbs(std::move(remainder_digits), dividend.is_negative())};
    }

    // Divides the magnitude by a single limb; the quotient keeps the sign of
    // value and the remainder is the magnitude remainder.
    static std::pair<bigint, detail::limb_t> div_mod_small(const bigint& value,
                                                           detail::limb_t divisor) {
        if (divisor == 0) {
            throw std::domain_error("division by zero");
        }
        auto [quotient, remainder] = divide_magnitude_by_small(value.limbs_, divisor);
        return {from_limbs(std::move(quotient), value.negative_), remainder};
    }

    bigint operator<<(int shift) const {
        if (shift < 0) {
            return shift_right(static_cast<std::size_t>(-static_cast<long long>(shift)));
        }
        return shift_left(static_cast<std::size_t>(shift));
    }

    bigint operator>>(int shift) const {
        if (shift < 0) {
            return shift_left(static_cast<std::size_t>(-static_cast<long long>(shift)));
        }
        return shift_right(static_cast<std::size_t>(shift));
    }

    bigint shift_left(std::size_t count) const {
        if (is_zero() || count == 0) {
            return *this;
        }
        const std::size_t limb_shift = count / detail::LIMB_BITS;
        const std::size_t bit_shift = count % detail::LIMB_BITS;
        std::vector<detail::limb_t> digits(limb_shift, 0);
        digits.reserve(limb_shift + limbs_.size() + 1);
        detail::limb_t carry = 0;
        for (const detail::limb_t limb : limbs_) {
            if (bit_shift == 0) {
                digits.push_back(limb);
            } else {
                digits.push_back(static_cast<detail::limb_t>(limb << bit_shift) | carry);
                carry = limb >> (detail::LIMB_BITS - bit_shift);
            }
        }
        if (carry != 0) {
            digits.push_back(carry);
        }
        return from_limbs(std::move(digits), negative_);
    }

    // Floor division by 2^count, matching an arithmetic shift on two's complement.
    bigint shift_right(std::size_t count) const {
        if (is_zero() || count == 0) {
            return *this;
        }
        const bool truncated = negative_ && !low_bits_zero(count);
        bigint result = from_limbs(shift_magnitude_right(limbs_, count), negative_);
        if (truncated) {
            result -= bigint::one();
        }
        return result;
    }

    // Division by 2^count rounding toward zero.
    bigint truncate_shift_right(std::size_t count) const {
        if (is_zero() || count == 0) {
            return *this;
        }
        return from_limbs(shift_magnitude_right(limbs_, count), negative_);
    }

    // Largest integer whose square does not exceed value. Newton iteration
    // from 2^ceil(bits/2), which is never below the root, until the iterate
    // stops decreasing.
    static bigint isqrt(const bigint& value) {
        if (value.is_negative()) {
            throw std::domain_error("square root of negative bigint");
        }
        if (value.is_zero()) {
            return bigint::zero();
        }
        bigint estimate = power_of_two((value.bit_length() + 1) / 2);
        while (true) {
            bigint next = (estimate + value / estimate).shift_right(1);
            if (next >= estimate) {
                return estimate;
            }
            estimate = std::move(next);
        }
    }

private:
    using digits_t = std::vector<detail::limb_t>;

    static void normalize_magnitude(digits_t& digits) {
        while (!digits.empty() && digits.back() == 0) {
            digits.pop_back();
        }
    }

    static std::strong_ordering compare_magnitude_vectors(const digits_t& lhs,
                                                          const digits_t& rhs) noexcept {
        if (lhs.size() != rhs.size()) {
            return lhs.size() < rhs.size() ? std::strong_ordering::less
                                           : std::strong_ordering::greater;
        }
        for (std::size_t index = lhs.size(); index-- > 0;) {
            const auto cmp = lhs[index] <=> rhs[index];
            if (cmp != std::strong_ordering::equal) {
                return cmp;
            }
        }
        return std::strong_ordering::equal;
    }

    static digits_t shift_magnitude_right(const digits_t& digits, std::size_t count) {
        const std::size_t limb_shift = count / detail::LIMB_BITS;
        if (limb_shift >= digits.size()) {
            return {};
        }
        const std::size_t bit_shift = count % detail::LIMB_BITS;
        digits_t result(digits.size() - limb_shift, 0);
        for (std::size_t index = 0; index < result.size(); ++index) {
            const std::size_t source = index + limb_shift;
            detail::limb_t value = digits[source] >> bit_shift;
            if (bit_shift != 0 && source + 1 < digits.size()) {
                value |= static_cast<detail::limb_t>(digits[source + 1]
                                                     << (detail::LIMB_BITS - bit_shift));
            }
            result[index] = value;
        }
        normalize_magnitude(result);
        return result;
    }

    static void shift_left_one(digits_t& digits) {
        detail::limb_t carry = 0;
        for (auto& digit : digits) {
            const detail::limb_t next_carry = digit >> (detail::LIMB_BITS - 1);
            digit = static_cast<detail::limb_t>(digit << 1) | carry;
            carry = next_carry;
        }
        if (carry != 0) {
            digits.push_back(carry);
        }
    }

    static digits_t add_magnitude(const digits_t& lhs, const digits_t& rhs) {
        const std::size_t max_len = std::max(lhs.size(), rhs.size());
        digits_t result;
        result.reserve(max_len + 1);
        detail::wide_t carry = 0;
        for (std::size_t index = 0; index < max_len; ++index) {
            detail::wide_t sum = carry;
            if (index < lhs.size()) {
                sum += lhs[index];
            }
            if (index < rhs.size()) {
                sum += rhs[index];
            }
            result.push_back(static_cast<detail::limb_t>(sum & detail::LIMB_MASK));
            carry = sum >> detail::LIMB_BITS;
        }
        if (carry != 0) {
            result.push_back(static_cast<detail::limb_t>(carry));
        }
        return result;
    }

    // Requires |lhs| >= |rhs|.
    static digits_t subtract_magnitude(const digits_t& lhs, const digits_t& rhs) {
        digits_t result;
        result.reserve(lhs.size());
        detail::wide_t borrow = 0;
        for (std::size_t index = 0; index < lhs.size(); ++index) {
            const detail::wide_t minuend = lhs[index];
            detail::wide_t subtrahend = borrow;
            if (index < rhs.size()) {
                subtrahend += rhs[index];
            }
            if (minuend >= subtrahend) {
                result.push_back(static_cast<detail::limb_t>(minuend - subtrahend));
                borrow = 0;
            } else {
                result.push_back(
                    static_cast<detail::limb_t>(minuend + detail::LIMB_RADIX - subtrahend));
                borrow = 1;
            }
        }
        normalize_magnitude(result);
        return result;
    }

    static void subtract_in_place(digits_t& lhs, const digits_t& rhs) {
        lhs = subtract_magnitude(lhs, rhs);
    }

    static digits_t multiply_magnitude_by_small(const digits_t& digits, detail::limb_t multiplier) {
        if (digits.empty() || multiplier == 0) {
            return {};
        }
        digits_t result;
        result.reserve(digits.size() + 1);
        detail::wide_t carry = 0;
        for (const auto digit : digits) {
            const detail::wide_t product = static_cast<detail::wide_t>(digit) * multiplier + carry;
            result.push_back(static_cast<detail::limb_t>(product & detail::LIMB_MASK));
            carry = product >> detail::LIMB_BITS;
        }
        if (carry != 0) {
            result.push_back(static_cast<detail::limb_t>(carry));
        }
        return result;
    }

    static std::pair<digits_t, detail::limb_t>
    divide_magnitude_by_small(const digits_t& digits, detail::limb_t divisor) {
        digits_t quotient(digits.size(), 0);
        detail::wide_t remainder = 0;
        for (std::size_t index = digits.size(); index-- > 0;) {
            const detail::wide_t current = (remainder << detail::LIMB_BITS) | digits[index];
            quotient[index] = static_cast<detail::limb_t>(current / divisor);
            remainder = current % divisor;
        }
        normalize_magnitude(quotient);
        return {std::move(quotient), static_cast<detail::limb_t>(remainder)};
    }

    // Restoring binary long division over the dividend's bits.
    static std::pair<digits_t, digits_t> divide_magnitude(const digits_t& dividend,
                                                          const digits_t& divisor) {
        if (divisor.empty()) {
            throw std::domain_error("division by zero");
        }
        if (compare_magnitude_vectors(dividend, divisor) == std::strong_ordering::less) {
            return {{}, dividend};
        }
        if (divisor.size() == 1) {
            auto [quotient, remainder] = divide_magnitude_by_small(dividend, divisor[0]);
            digits_t remainder_digits;
            if (remainder != 0) {
                remainder_digits.push_back(remainder);
            }
            return {std::move(quotient), std::move(remainder_digits)};
        }
        digits_t quotient(dividend.size(), 0);
        digits_t remainder;
        remainder.reserve(divisor.size() + 1);
        const std::size_t total_bits = (dividend.size() - 1) * detail::LIMB_BITS +
                                       static_cast<std::size_t>(std::bit_width(dividend.back()));
        for (std::size_t bit = total_bits; bit-- > 0;) {
            shift_left_one(remainder);
            if (((dividend[bit / detail::LIMB_BITS] >> (bit % detail::LIMB_BITS)) & 1u) != 0) {
                if (remainder.empty()) {
                    remainder.push_back(1);
                } else {
                    remainder[0] |= 1u;
                }
            }
            if (compare_magnitude_vectors(remainder, divisor) != std::strong_ordering::less) {
                subtract_in_place(remainder, divisor);
                quotient[bit / detail::LIMB_BITS] |= detail::limb_t{1}
                                                     << (bit % detail::LIMB_BITS);
            }
        }
        normalize_magnitude(quotient);
        normalize_magnitude(remainder);
        return {std::move(quotient), std::move(remainder)};
    }

    static digits_t multiply_schoolbook(const digits_t& lhs, const digits_t& rhs) {
        if (lhs.empty() || rhs.empty()) {
            return {};
        }
        digits_t result(lhs.size() + rhs.size(), 0);
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            const detail::wide_t lhs_digit = lhs[i];
            detail::wide_t carry = 0;
            for (std::size_t j = 0; j < rhs.size(); ++j) {
                const detail::wide_t current = lhs_digit * rhs[j] + result[i + j] + carry;
                result[i + j] = static_cast<detail::limb_t>(current & detail::LIMB_MASK);
                carry = current >> detail::LIMB_BITS;
            }
            result[i + rhs.size()] = static_cast<detail::limb_t>(carry);
        }
        normalize_magnitude(result);
        return result;
    }

    static digits_t multiply_magnitude(const digits_t& lhs, const digits_t& rhs) {
        if (lhs.empty() || rhs.empty()) {
            return {};
        }
        if (lhs.size() == 1) {
            return multiply_magnitude_by_small(rhs, lhs[0]);
        }
        if (rhs.size() == 1) {
            return multiply_magnitude_by_small(lhs, rhs[0]);
        }
        constexpr std::size_t KARATSUBA_THRESHOLD = 128;
        if (lhs.size() + rhs.size() <= KARATSUBA_THRESHOLD) {
            return multiply_schoolbook(lhs, rhs);
        }
        const std::size_t n = std::max(lhs.size(), rhs.size());
        const std::size_t half = n / 2;
        auto split_low = [&](const digits_t& value) {
            digits_t low(value.begin(), value.begin() + std::min(half, value.size()));
            normalize_magnitude(low);
            return low;
        };
        auto split_high = [&](const digits_t& value) {
            if (value.size() <= half) {
                return digits_t{};
            }
            return digits_t(value.begin() + half, value.end());
        };
        const auto lhs_low = split_low(lhs);
        const auto lhs_high = split_high(lhs);
        const auto rhs_low = split_low(rhs);
        const auto rhs_high = split_high(rhs);
        const auto z0 = multiply_magnitude(lhs_low, rhs_low);
        const auto z2 = multiply_magnitude(lhs_high, rhs_high);
        const auto lhs_sum = add_magnitude(lhs_low, lhs_high);
        const auto rhs_sum = add_magnitude(rhs_low, rhs_high);
        const auto z1 = multiply_magnitude(lhs_sum, rhs_sum);
        const auto z1_final = subtract_magnitude(subtract_magnitude(z1, z0), z2);
        auto shift_and_add = [](digits_t& target, const digits_t& value, std::size_t shift) {
            if (value.empty()) {
                return;
            }
            digits_t shifted;
            shifted.reserve(value.size() + shift);
            shifted.insert(shifted.end(), shift, detail::limb_t{0});
            shifted.insert(shifted.end(), value.begin(), value.end());
            target = add_magnitude(target, shifted);
        };
        digits_t result = z0;
        shift_and_add(result, z1_final, half);
        shift_and_add(result, z2, half * 2);
        normalize_magnitude(result);
        return result;
    }

    std::strong_ordering compare(const bigint& other) const noexcept {
        if (negative_ != other.negative_) {
            return negative_ ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        if (negative_) {
            return compare_magnitude_vectors(other.limbs_, limbs_);
        }
        return compare_magnitude(other);
    }

    std::strong_ordering compare_magnitude(const bigint& other) const noexcept {
        return compare_magnitude_vectors(limbs_, other.limbs_);
    }

    void normalize() {
        normalize_magnitude(limbs_);
        if (limbs_.empty()) {
            negative_ = false;
        }
    }

    digits_t limbs_;
    bool negative_ = false;
};

} // namespace fxpoint::core
