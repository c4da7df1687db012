// tests/unit/test_number_text.cpp — Decimal, radix and repr text for Number, plus literal parsing.

#include <fxpoint/fxpoint.hpp>

#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

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

void expect_text(const std::string& actual, const std::string& expected, const std::string& label) {
    if (actual != expected) {
        std::cerr << "FAILED: " << label << ": got \"" << actual << "\", expected \"" << expected
                  << "\"" << std::endl;
        ++failures;
    }
}

void expect(bool condition, const std::string& label) {
    if (!condition) {
        std::cerr << "FAILED: " << label << std::endl;
        ++failures;
    }
}

void test_decimal_output() {
    const Format fmt = fxpoint::make_format(8, 8);
    expect_text(fmt.from_rational(1, 2).to_decimal_string(), "0.5", "one half");
    expect_text(fmt.from_rational(1, 3).to_decimal_string(), "0.332", "85/256 at default digits");
    expect_text(fmt.from_rational(-1, 3).to_decimal_string(), "-0.332", "negative third");
    expect_text(fmt.from_int(42).to_decimal_string(), "42", "integers print without a point");
    expect_text(fmt.from_int(42).to_decimal_string(2), "42.00", "explicit digits keep zeros");
    expect_text(fmt.from_rational(5, 2).to_decimal_string(0), "3", "2.5 rounds away at zero digits");
    expect_text(fmt.from_rational(-5, 2).to_decimal_string(0), "-3", "-2.5 rounds away at zero digits");
    expect_text(fmt.from_scaled(BigInt(-1)).to_decimal_string(2), "0.00", "negative rounding to zero has no sign");
    expect_text(fmt.from_scaled(BigInt(-1)).to_decimal_string(), "-0.004", "smallest negative value");
    expect_text(fmt.zero().to_decimal_string(), "0", "zero");
    expect_text(fmt.from_scaled(BigInt(255)).to_decimal_string(2), "1.00", "carry into the integer part");

    std::ostringstream os;
    os << fmt.from_rational(-9, 4);
    expect_text(os.str(), "-2.25", "stream output");

    expect(throws<std::invalid_argument>([&] { (void)fmt.one().to_decimal_string(-1); }),
           "negative digit count");
}

void test_decimal_roundtrip(std::mt19937_64& rng) {
    for (int fraction_bits : {1, 7, 32, 64, 100}) {
        const Format fmt(fraction_bits);
        for (int iteration = 0; iteration < 32; ++iteration) {
            const Number value = fxpoint::util::random_number(rng, fmt, 1'000'000);
            const std::string text = value.to_decimal_string();
            expect(fmt.from_string(text) == value, "decimal roundtrip of " + value.to_repr() + " via " + text);
        }
    }
    // powers of two survive the trip at full precision
    const Format fine(64);
    for (int exponent = 0; exponent <= 64; ++exponent) {
        const Number value = fine.from_scaled(BigInt::power_of_two(static_cast<std::size_t>(64 - exponent)));
        expect(fine.from_string(value.to_decimal_string()) == value,
               "2^-" + std::to_string(exponent) + " roundtrip");
    }
    expect_text(fine.from_scaled(BigInt(1)).to_decimal_string(64),
                "0.0000000000000000000542101086242752217003726400434970855712890625",
                "2^-64 printed exactly");
}

void test_radix_output() {
    const Format fmt = fxpoint::make_format(8, 8);
    const Number value = fmt.from_rational(3, 2);
    expect_text(value.to_binary_string(), "1.10000000", "binary");
    expect_text((-value).to_binary_string(), "-1.10000000", "signed binary");
    expect_text((-value).to_binary_string(true), "11111110.10000000", "two's complement binary");
    expect_text(value.to_binary_string(true), "00000001.10000000", "two's complement keeps the width");
    expect_text(value.to_hex_string(), "1.80", "hex");
    expect_text((-value).to_hex_string(true), "fe.80", "two's complement hex");
    expect_text(value.to_octal_string(), "1.400", "octal pads the fraction to whole digits");
    expect_text((-value).to_octal_string(true), "376.400", "two's complement octal");

    const Format integers(0, 8);
    expect_text(integers.from_int(5).to_binary_string(), "101", "no point without fraction bits");
    expect_text(integers.from_int(-1).to_hex_string(true), "ff", "integer two's complement");

    const Format unbounded(4);
    expect_text(unbounded.from_rational(-1, 2).to_binary_string(true), "1.1000",
                "unbounded two's complement uses the minimal width");
    expect_text(unbounded.from_int(1000).to_hex_string(), "3e8.0", "unbounded hex");
}

void test_repr() {
    const Format fmt = fxpoint::make_format(8, 8);
    const Number value = fmt.from_rational(3, 2);
    expect_text(value.to_repr(), "Number(384, Format(8, 8))", "bounded repr");
    const Number unbounded = Format(64).from_scaled(BigInt(-5));
    expect_text(unbounded.to_repr(), "Number(-5, Format(none, 64))", "unbounded repr");

    const Number parsed = Number::from_repr(value.to_repr());
    expect(parsed == value && parsed.format() == value.format(), "repr roundtrip");
    const Number spaced = Number::from_repr("  Number( -5 ,Format( none , 64 ) ) ");
    expect(spaced == unbounded && !spaced.format().is_bounded(), "repr with spaces");

    expect(throws<fxpoint::ValueError>([] { (void)Number::from_repr("Number(384, Format(8, 8)"); }),
           "unterminated repr");
    expect(throws<fxpoint::ValueError>([] { (void)Number::from_repr("Num(1, Format(8, 8))"); }),
           "wrong prefix");
    expect(throws<fxpoint::ValueError>([] { (void)Number::from_repr("Number(1, Format(-1, 8))"); }),
           "negative integer bits");
    expect(throws<fxpoint::ValueError>([] { (void)Number::from_repr("Number(1, Format(0, 0))"); }),
           "empty format");
    expect(throws<fxpoint::OverflowError>([] { (void)Number::from_repr("Number(40000, Format(8, 8))"); }),
           "repr value outside its format");
}

void test_parsing() {
    const Format fmt = fxpoint::make_format(16, 16);
    expect(fmt.from_string("  -12.25  ") == fmt.from_rational(-49, 4), "signed decimal with spaces");
    expect(fmt.from_string("1e3") == fmt.from_int(1000), "exponent");
    expect(fmt.from_string("2.5E-1") == fmt.from_rational(1, 4), "negative exponent");
    expect(fmt.from_string(".5") == fmt.from_rational(1, 2), "leading point");
    expect(fmt.from_string("5.") == fmt.from_int(5), "trailing point");
    expect(fmt.from_string("+0.125") == fmt.from_rational(1, 8), "explicit plus");
    expect(fmt.from_string("0.1").scaled_value() == BigInt(6554), "0.1 rounds to nearest");

    const Format coarse = fxpoint::make_format(8, 8);
    // exactly half a unit: ties round away from zero
    expect(coarse.from_string("0.001953125").scaled_value() == BigInt(1), "half unit rounds up");
    expect(coarse.from_string("-0.001953125").scaled_value() == BigInt(-1), "negative half unit rounds down");
    expect(throws<fxpoint::OverflowError>([&] { (void)coarse.from_string("300"); }), "parsed value overflows");

    const std::vector<std::string> malformed = {"", "   ", "abc", "1.2.3", "1e", "--1", "1e+", ".", "0x10",
                                                "1 2", "1e100001", "nan"};
    for (const auto& text : malformed) {
        expect(throws<fxpoint::ValueError>([&] { (void)fmt.from_string(text); }), "rejects \"" + text + "\"");
    }
    expect(throws<std::invalid_argument>([&] { (void)fmt.from_string("x"); }),
           "ValueError is an invalid_argument");
    expect(Format(8).from_string("1e-100000").is_zero(), "tiny literal rounds to zero");
}

} // namespace

int main() {
    std::mt19937_64 rng(81);
    test_decimal_output();
    test_decimal_roundtrip(rng);
    test_radix_output();
    test_repr();
    test_parsing();
    if (failures != 0) {
        std::cerr << failures << " text checks failed" << std::endl;
        return 1;
    }
    std::cout << "number text tests passed\n";
    return 0;
}
