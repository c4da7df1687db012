#include <fxpoint/core/bigint.hpp>
#include <fxpoint/core/detail/rounding.hpp>
#include <fxpoint/io/format.hpp>
#include <fxpoint/io/parse.hpp>
#include <fxpoint/util/random.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using bigint = fxpoint::core::bigint;

bigint random_small_bigint(std::mt19937_64& rng) {
    static std::uniform_int_distribution<std::int64_t> dist(-1'000'000, 1'000'000);
    return bigint(dist(rng));
}

bool check_equal(const bigint& lhs, const bigint& rhs, std::string_view label) {
    if (lhs == rhs) {
        return true;
    }
    std::cerr << label << " mismatch: " << fxpoint::io::to_string(lhs) << " != "
              << fxpoint::io::to_string(rhs) << "\n";
    return false;
}

bool test_string_roundtrip(std::mt19937_64& rng) {
    const std::vector<int> bases = {2, 8, 10, 16, 36};
    for (int base : bases) {
        for (int iteration = 0; iteration < 16; ++iteration) {
            const auto original = fxpoint::util::random_bigint(rng, 3);
            const std::string text = fxpoint::io::to_string(original, base);
            const auto parsed = fxpoint::io::parse_bigint(text, base);
            if (!check_equal(original, parsed, "string roundtrip")) {
                return false;
            }
        }
    }
    if (fxpoint::io::to_string(bigint(255), 16) != "ff" ||
        fxpoint::io::to_string(bigint(-5), 2) != "-101") {
        std::cerr << "radix digits\n";
        return false;
    }
    bool rejected = false;
    try {
        (void)fxpoint::io::parse_bigint("12a", 10);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    if (!rejected) {
        std::cerr << "parser accepted an invalid digit\n";
        return false;
    }
    return true;
}

bool test_add_sub_properties(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto a = fxpoint::util::random_bigint(rng, 4);
        const auto b = fxpoint::util::random_bigint(rng, 2);
        const auto sum = a + b;
        if (!check_equal(sum - b, a, "addition identity")) {
            return false;
        }
        if (!check_equal(sum - a, b, "addition identity 2")) {
            return false;
        }
        if (!check_equal((a - b) + b, a, "subtraction identity")) {
            return false;
        }
    }
    return true;
}

bool test_multiplication(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto a = random_small_bigint(rng);
        const auto b = random_small_bigint(rng);
        const std::int64_t expected = static_cast<std::int64_t>(a) * static_cast<std::int64_t>(b);
        if (!check_equal(a * b, bigint(expected), "small product")) {
            return false;
        }
    }
    // Large enough to go through Karatsuba on both sides.
    const auto a = fxpoint::util::random_bigint(rng, 300);
    const auto b = fxpoint::util::random_bigint(rng, 280);
    const auto product = a * b;
    const auto [quotient, remainder] = bigint::div_mod(product, b);
    if (!check_equal(quotient, a, "karatsuba product quotient") || !remainder.is_zero()) {
        std::cerr << "karatsuba product does not divide back\n";
        return false;
    }
    return true;
}

bool test_div_mod(std::mt19937_64& rng) {
    const auto two = bigint(2);
    for (int iteration = 0; iteration < 32; ++iteration) {
        auto dividend = fxpoint::util::random_bigint(rng, 5);
        auto divisor = fxpoint::util::random_bigint(rng, 2);
        if (divisor.is_zero()) {
            divisor = bigint(1);
        }
        const auto [quotient, remainder] = bigint::div_mod(dividend, divisor);
        if (!check_equal(quotient * divisor + remainder, dividend, "div_mod reconstruction")) {
            return false;
        }
        if (!remainder.is_zero()) {
            if (remainder.is_negative() != dividend.is_negative()) {
                std::cerr << "remainder sign does not match dividend\n";
                return false;
            }
            if (!(remainder.abs() < divisor.abs())) {
                std::cerr << "remainder magnitude not less than divisor\n";
                return false;
            }
        }
        const auto [quotient2, remainder2] = bigint::div_mod(dividend, two);
        if (!check_equal(quotient2 * two + remainder2, dividend, "div_mod small divisor")) {
            return false;
        }
    }
    bool caught = false;
    try {
        (void)bigint::div_mod(bigint(3), bigint::zero());
    } catch (const std::domain_error&) {
        caught = true;
    }
    if (!caught) {
        std::cerr << "div_mod must reject a zero divisor\n";
        return false;
    }
    return true;
}

bool test_div_mod_scaled_multiples() {
    const auto divisor = fxpoint::io::parse_bigint("1234567");
    bigint dividend = bigint::zero();
    bigint multiplier = bigint::one();
    bigint expected_quotient = bigint::zero();
    for (int index = 0; index < 70; ++index) {
        dividend += divisor * multiplier;
        expected_quotient += multiplier;
        multiplier += multiplier;
    }
    const auto [quotient, remainder] = bigint::div_mod(dividend, divisor);
    if (!check_equal(quotient, expected_quotient, "div_mod scaled quotient")) {
        return false;
    }
    if (!remainder.is_zero()) {
        std::cerr << "div_mod scaled multiples remainder should be zero\n";
        return false;
    }
    return true;
}

bool test_shift_ops(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto value = fxpoint::util::random_bigint(rng, 3);
        for (int count : {0, 1, 5, 31, 32, 33, 70}) {
            const auto scale = bigint::power_of_two(static_cast<std::size_t>(count));
            if (!check_equal(value << count, value * scale, "shift left")) {
                return false;
            }
            const auto truncated = bigint::div_mod(value, scale).first;
            if (!check_equal(value.truncate_shift_right(static_cast<std::size_t>(count)), truncated,
                             "truncating shift right")) {
                return false;
            }
            // floor division: one below the truncated quotient for inexact negatives
            auto floored = truncated;
            if (value.is_negative() && !value.low_bits_zero(static_cast<std::size_t>(count))) {
                floored -= bigint::one();
            }
            if (!check_equal(value >> count, floored, "shift right")) {
                return false;
            }
        }
    }
    return true;
}

bool test_rounding_helpers() {
    using fxpoint::core::detail::round_div;
    using fxpoint::core::detail::round_shift_right;
    // 5/2, -5/2, 7/4, -5/4
    if (!check_equal(round_shift_right(bigint(5), 1), bigint(3), "round 2.5") ||
        !check_equal(round_shift_right(bigint(-5), 1), bigint(-3), "round -2.5") ||
        !check_equal(round_shift_right(bigint(7), 2), bigint(2), "round 1.75") ||
        !check_equal(round_shift_right(bigint(-5), 2), bigint(-1), "round -1.25")) {
        return false;
    }
    if (!check_equal(round_div(bigint(1), bigint(2)), bigint(1), "round_div 1/2") ||
        !check_equal(round_div(bigint(-1), bigint(2)), bigint(-1), "round_div -1/2") ||
        !check_equal(round_div(bigint(10), bigint(-3)), bigint(-3), "round_div 10/-3") ||
        !check_equal(round_div(bigint(5), bigint(3)), bigint(2), "round_div 5/3")) {
        return false;
    }
    return true;
}

bool test_isqrt(std::mt19937_64& rng) {
    for (int iteration = 0; iteration < 32; ++iteration) {
        const auto value = fxpoint::util::random_bigint(rng, 4, false);
        const auto root = bigint::isqrt(value);
        const auto next = root + bigint::one();
        if (root * root > value || next * next <= value) {
            std::cerr << "isqrt bracket failed for " << fxpoint::io::to_string(value) << "\n";
            return false;
        }
    }
    if (!check_equal(bigint::isqrt(bigint(1'000'000)), bigint(1000), "isqrt perfect square")) {
        return false;
    }
    return true;
}

bool test_integral_conversions() {
    const auto positive = bigint(1'234'567'890);
    const auto negative = bigint(-42);
    if (static_cast<int>(positive) != 1'234'567'890) {
        return false;
    }
    if (static_cast<long long>(positive) != 1'234'567'890LL) {
        return false;
    }
    if (static_cast<int>(negative) != -42) {
        return false;
    }
    if (static_cast<std::int64_t>(bigint(INT64_MIN)) != INT64_MIN) {
        std::cerr << "int64 minimum roundtrip\n";
        return false;
    }
    bool threw = false;
    try {
        (void)static_cast<unsigned long long>(negative);
    } catch (const std::overflow_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "negative to unsigned should overflow\n";
        return false;
    }
    threw = false;
    try {
        (void)static_cast<std::int64_t>(bigint::power_of_two(64));
    } catch (const std::overflow_error&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "2^64 to int64 should overflow\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    std::mt19937_64 rng(0x5eedf1edULL);
    if (!test_string_roundtrip(rng)) return 1;
    if (!test_add_sub_properties(rng)) return 1;
    if (!test_multiplication(rng)) return 1;
    if (!test_div_mod(rng)) return 1;
    if (!test_div_mod_scaled_multiples()) return 1;
    if (!test_shift_ops(rng)) return 1;
    if (!test_rounding_helpers()) return 1;
    if (!test_isqrt(rng)) return 1;
    if (!test_integral_conversions()) return 1;
    std::cout << "bigint ops tests passed\n";
    return 0;
}
