// tests/unit/test_number_arith.cpp — Rounding, mixed formats and range checks of Number arithmetic.

#include <fxpoint/fxpoint.hpp>

#include <compare>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace {

using fxpoint::Format;
using fxpoint::Number;
using BigInt = fxpoint::core::bigint;

template <typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

int failures = 0;

void expect(bool condition, const std::string& label) {
    if (!condition) {
        std::cerr << "FAILED: " << label << std::endl;
        ++failures;
    }
}

void test_rounding_halves() {
    // One fraction bit: 0.5 * 0.5 = 0.25 sits halfway between 0 and 0.5.
    const Format half_bits = fxpoint::make_format(8, 1);
    const Number half = half_bits.from_rational(1, 2);
    const Number minus_half = -half;
    expect((half * half).scaled_value() == BigInt(1), "0.5 * 0.5 rounds up to 0.5");
    expect((minus_half * half).scaled_value() == BigInt(-1), "-0.5 * 0.5 rounds down to -0.5");
    const Number three_halves = half_bits.from_rational(3, 2);
    // 1.5 * 0.5 = 0.75 -> halfway between 0.5 and 1.0
    expect((three_halves * half).scaled_value() == BigInt(2), "1.5 * 0.5 rounds to 1.0");
    expect((-three_halves * half).scaled_value() == BigInt(-2), "-1.5 * 0.5 rounds to -1.0");

    // Right shifts follow the same rule.
    const Format fmt = fxpoint::make_format(8, 8);
    const Number three = fmt.from_scaled(BigInt(3));
    expect((three >> 1).scaled_value() == BigInt(2), "3 >> 1 rounds away");
    expect(((-three) >> 1).scaled_value() == BigInt(-2), "-3 >> 1 rounds away");
    expect((three << 2).scaled_value() == BigInt(12), "3 << 2");
    expect((three >> -2) == (three << 2), "negative shift reverses direction");
}

void test_identities(std::mt19937_64& rng) {
    const Format fmt(48);
    for (int iteration = 0; iteration < 64; ++iteration) {
        const Number a = fxpoint::util::random_number(rng, fmt, 1000);
        const Number b = fxpoint::util::random_number(rng, fmt, 1000);
        expect(a + b == b + a, "addition commutes");
        expect(a * b == b * a, "multiplication commutes");
        expect((a + b) - b == a, "addition is exact");
        expect(a - a == fmt.zero(), "a - a == 0");
        if (!a.is_zero()) {
            expect(a / a == fmt.one(), "a / a == 1");
        }
        expect(a * fmt.one() == a, "a * 1 == a");
        expect(-(-a) == a, "double negation");
        expect(a.abs() >= fmt.zero(), "abs is non-negative");
    }
}

void test_immutability() {
    const Format fmt = fxpoint::make_format(16, 16);
    const Number a = fmt.from_rational(7, 4);
    const Number b = fmt.from_rational(1, 4);
    const BigInt a_before = a.scaled_value();
    const BigInt b_before = b.scaled_value();
    (void)(a + b);
    (void)(a * b);
    (void)(a / b);
    (void)a.sqrt();
    (void)a.exp();
    expect(a.scaled_value() == a_before && b.scaled_value() == b_before,
           "operations leave operands unchanged");

    Number c = a;
    c += b;
    expect(c == fmt.from_int(2) && a.scaled_value() == a_before, "compound assignment rebinds only the target");
}

void test_division() {
    const Format fmt = fxpoint::make_format(8, 8);
    const Number one = fmt.one();
    const Number three = fmt.from_int(3);
    const Number third = one / three;
    expect(third.scaled_value() == BigInt(85), "1/3 at 8 bits is 85/256");
    const Number back = third * 3;
    expect(back.scaled_value() == BigInt(255), "1/3 * 3 keeps the rounding error");
    expect(back.to_decimal_string(2) == "1.00", "255/256 prints as 1.00 with two digits");
    expect((-one / three).scaled_value() == BigInt(-85), "-1/3 is symmetric");

    expect(throws<fxpoint::DivisionByZero>([&] { (void)(one / fmt.zero()); }), "division by zero");
    expect(throws<fxpoint::DivisionByZero>([&] { (void)(one / 0); }), "division by integer zero");
    expect(throws<fxpoint::DivisionByZero>([&] { (void)(one % fmt.zero()); }), "remainder by zero");
    expect(throws<std::domain_error>([&] { (void)(one / fmt.zero()); }), "DivisionByZero is a domain_error");

    // truncated remainder takes the sign of the dividend
    const Number seven_halves = fmt.from_rational(7, 2);
    expect(seven_halves % fmt.from_int(2) == fmt.from_rational(3, 2), "3.5 % 2");
    expect((-seven_halves) % fmt.from_int(2) == fmt.from_rational(-3, 2), "-3.5 % 2");
    expect(seven_halves % fmt.from_int(-2) == fmt.from_rational(3, 2), "3.5 % -2");
}

void test_integer_operands() {
    const Format fmt = fxpoint::make_format(16, 16);
    const Number x = fmt.from_rational(5, 2);
    expect(x + 1 == fmt.from_rational(7, 2), "Number + int");
    expect(1 + x == fmt.from_rational(7, 2), "int + Number");
    expect(x - 3 == fmt.from_rational(-1, 2), "Number - int");
    expect(3 - x == fmt.from_rational(1, 2), "int - Number");
    expect(x * 4 == fmt.from_int(10), "Number * int");
    expect(-2 * x == fmt.from_int(-5), "int * Number");
    expect(x / 2 == fmt.from_rational(5, 4), "Number / int");
    expect(5 / x == fmt.from_int(2), "int / Number");
    expect(x > 2 && x < 3 && x != 2, "comparisons with int");
    expect(fmt.from_int(4) == 4, "equality with int");
    expect((x <=> 3) == std::strong_ordering::less, "three-way comparison with int");
}

void test_mixed_formats() {
    const Format coarse = fxpoint::make_format(8, 4);
    const Format fine = fxpoint::make_format(4, 12);
    const Number a = coarse.from_rational(3, 2);
    const Number b = fine.from_rational(1, 1024);
    const Number sum = a + b;
    expect(sum.format() == fxpoint::make_format(8, 12), "common format of a mixed sum");
    expect(sum.scaled_value() == BigInt(6148), "mixed sum is exact in the common format");
    expect(a < coarse.from_int(2) && b < a, "ordering across formats");
    expect(coarse.from_rational(1, 2) == fine.from_rational(1, 2), "equal values in different formats");

    // explicit result formats
    const Format narrow = fxpoint::make_format(8, 2);
    const Number product = fxpoint::mul(a, a, narrow);
    expect(product.format() == narrow && product.scaled_value() == BigInt(9), "2.25 into two fraction bits");
    const Number quotient = fxpoint::div(coarse.one(), coarse.from_int(3), fine);
    expect(quotient.scaled_value() == BigInt(1365), "1/3 computed at the result resolution");
    expect(fxpoint::add(a, b, coarse).scaled_value() == BigInt(24), "sum rounded into the coarse format");
    expect(fxpoint::sub(a, b, fine).scaled_value() == BigInt(6140), "difference in the fine format");
}

void test_overflow() {
    const Format fmt = fxpoint::make_format(8, 8);
    const Number big = fmt.from_int(100);
    expect(throws<fxpoint::OverflowError>([&] { (void)(big + big); }), "sum overflow");
    expect(throws<fxpoint::OverflowError>([&] { (void)(big * 2); }), "product overflow");
    expect(throws<fxpoint::OverflowError>([&] { (void)(big << 1); }), "shift overflow");
    expect(throws<fxpoint::OverflowError>([&] { (void)(-fmt.from_int(-128)); }), "negating the minimum");
    expect(throws<fxpoint::OverflowError>([&] { (void)fmt.from_int(-128).abs(); }), "abs of the minimum");
    expect((fmt.from_int(-100) - fmt.from_int(28)) == -128, "minimum reachable by subtraction");

    // integer part bits 0..n for a selection of widths
    for (int bits = 1; bits <= 40; bits += 13) {
        const Format range = fxpoint::make_format(bits, 3);
        const std::int64_t limit = std::int64_t{1} << (bits - 1);
        expect(range.from_int(limit - 1).to_integer<std::int64_t>() == limit - 1, "largest integer fits");
        expect(range.from_int(-limit).to_integer<std::int64_t>() == -limit, "smallest integer fits");
        expect(throws<fxpoint::OverflowError>([&] { (void)range.from_int(limit); }), "one past the top");
        expect(throws<fxpoint::OverflowError>([&] { (void)range.from_int(-limit - 1); }), "one past the bottom");
    }

    const Format unbounded(8);
    const Number huge = unbounded.from_int(BigInt::power_of_two(500));
    expect((huge * huge).to_bigint() == BigInt::power_of_two(1000), "unbounded formats never overflow");
    expect(throws<fxpoint::OverflowError>([&] { (void)huge.to_integer<std::int64_t>(); }),
           "to_integer reports values that do not fit");
}

void test_conversions() {
    const Format fmt = fxpoint::make_format(16, 16);
    const Number x = fmt.from_rational(-7, 2);
    expect(x.to_bigint() == BigInt(-3), "to_bigint truncates toward zero");
    expect(x.to_integer<int>() == -3, "to_integer truncates toward zero");
    expect(x.to_double() == -3.5, "to_double of an exact value");
    expect(x.is_integer() == false && fmt.from_int(3).is_integer(), "is_integer");
    expect(!fmt.zero() && static_cast<bool>(x), "explicit bool");
    expect(x.signum() == -1 && fmt.zero().signum() == 0, "signum");

    const Format wide(200);
    const Number tiny = wide.from_scaled(BigInt(1));
    expect(tiny.to_double() > 0.0 && tiny.to_double() < 1e-59, "to_double of a tiny value");
    expect(x.to_format(wide).to_format(fmt) == x, "widening and narrowing back is exact");
}

} // namespace

int main() {
    std::mt19937_64 rng(2024);
    test_rounding_halves();
    test_identities(rng);
    test_immutability();
    test_division();
    test_integer_operands();
    test_mixed_formats();
    test_overflow();
    test_conversions();
    if (failures != 0) {
        std::cerr << failures << " arithmetic checks failed" << std::endl;
        return 1;
    }
    std::cout << "number arithmetic tests passed\n";
    return 0;
}
