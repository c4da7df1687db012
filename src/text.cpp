#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fxpoint/core/detail/rounding.hpp"
#include "fxpoint/io/format.hpp"
#include "fxpoint/io/parse.hpp"
#include "fxpoint/number.hpp"

namespace fxpoint {

    namespace {

        using core::bigint;

        std::string_view trim(std::string_view text) {
            const auto is_space = [](char ch) {
                return std::isspace(static_cast<unsigned char>(ch)) != 0;
            };
            while (!text.empty() && is_space(text.front())) {
                text.remove_prefix(1);
            }
            while (!text.empty() && is_space(text.back())) {
                text.remove_suffix(1);
            }
            return text;
        }

        bool is_digit(char ch) {
            return ch >= '0' && ch <= '9';
        }

        bigint power_of_ten(long long exponent) {
            bigint result = bigint::one();
            bigint base(10);
            while (exponent > 0) {
                if ((exponent & 1) != 0) {
                    result *= base;
                }
                exponent >>= 1;
                if (exponent > 0) {
                    base *= base;
                }
            }
            return result;
        }

        // Smallest digit count d with 10^-d <= 2^-fraction_bits.
        int decimal_digits_for(int fraction_bits) {
            // log10(2) rounded up
            return static_cast<int>((static_cast<long long>(fraction_bits) * 30103 + 99999) / 100000);
        }

        void pad_left(std::string &text, std::size_t width) {
            if (text.size() < width) {
                text.insert(0, width - text.size(), '0');
            }
        }

        // Fixed-point digits in a power-of-two radix. Signed mode prints the
        // magnitude after a '-'; two's-complement mode prints the bit pattern.
        std::string radix_string(const Number &value, int radix_bits, bool twos_complement) {
            const Format &format = value.format();
            const int fraction_bits = format.fraction_bits();
            const int radix = 1 << radix_bits;
            const int fraction_digits = (fraction_bits + radix_bits - 1) / radix_bits;
            const auto fraction_width = static_cast<std::size_t>(fraction_digits * radix_bits);

            bigint pattern;
            bool negative = false;
            std::size_t integer_digits = 1;
            if (twos_complement) {
                const std::size_t width =
                    format.is_bounded()
                        ? static_cast<std::size_t>(*format.total_bits())
                        : std::max(value.scaled_value().bit_length() + 1,
                                   static_cast<std::size_t>(fraction_bits) + 1);
                pattern = value.scaled_value();
                if (pattern.is_negative()) {
                    pattern += bigint::power_of_two(width);
                }
                const std::size_t integer_width = width - static_cast<std::size_t>(fraction_bits);
                integer_digits = std::max<std::size_t>(
                    1, (integer_width + static_cast<std::size_t>(radix_bits) - 1) /
                           static_cast<std::size_t>(radix_bits));
            } else {
                pattern = value.scaled_value().abs();
                negative = value.scaled_value().is_negative();
            }

            pattern = pattern.shift_left(fraction_width - static_cast<std::size_t>(fraction_bits));
            const bigint integer_part = pattern.shift_right(fraction_width);
            const bigint fraction_part = pattern - integer_part.shift_left(fraction_width);

            std::string text = io::to_string(integer_part, radix);
            pad_left(text, integer_digits);
            if (negative) {
                text.insert(0, 1, '-');
            }
            if (fraction_digits > 0) {
                std::string digits = io::to_string(fraction_part, radix);
                pad_left(digits, static_cast<std::size_t>(fraction_digits));
                text += '.';
                text += digits;
            }
            return text;
        }

        // Reads "Number(<int>, Format(<int|none>, <int>))".
        class ReprReader {
          public:
            explicit ReprReader(std::string_view text) : text_(text) {
            }

            void expect(std::string_view token) {
                skip_spaces();
                if (text_.substr(0, token.size()) != token) {
                    fail();
                }
                text_.remove_prefix(token.size());
            }

            bool accept(std::string_view token) {
                skip_spaces();
                if (text_.substr(0, token.size()) != token) {
                    return false;
                }
                text_.remove_prefix(token.size());
                return true;
            }

            std::string_view integer_token() {
                skip_spaces();
                std::size_t length = 0;
                if (length < text_.size() && (text_[length] == '-' || text_[length] == '+')) {
                    ++length;
                }
                const std::size_t first_digit = length;
                while (length < text_.size() && is_digit(text_[length])) {
                    ++length;
                }
                if (length == first_digit) {
                    fail();
                }
                const std::string_view token = text_.substr(0, length);
                text_.remove_prefix(length);
                return token;
            }

            int small_integer() {
                const std::string_view token = integer_token();
                const bigint value = io::parse_bigint(token);
                if (value.is_negative() || value.bit_length() > 30) {
                    fail();
                }
                return static_cast<int>(value);
            }

            void finish() {
                skip_spaces();
                if (!text_.empty()) {
                    fail();
                }
            }

            [[noreturn]] static void fail() {
                throw ValueError("malformed Number representation");
            }

          private:
            void skip_spaces() {
                while (!text_.empty() && std::isspace(static_cast<unsigned char>(text_.front())) != 0) {
                    text_.remove_prefix(1);
                }
            }

            std::string_view text_;
        };

    } // namespace

    Number Format::from_string(std::string_view text) const {
        const std::string_view body = trim(text);
        if (body.empty()) {
            throw ValueError("empty numeric literal");
        }

        std::size_t index = 0;
        bool negative = false;
        if (body[index] == '+' || body[index] == '-') {
            negative = (body[index] == '-');
            ++index;
        }

        std::string digits;
        long long fraction_digits = 0;
        bool seen_point = false;
        for (; index < body.size(); ++index) {
            const char ch = body[index];
            if (is_digit(ch)) {
                digits.push_back(ch);
                if (seen_point) {
                    ++fraction_digits;
                }
            } else if (ch == '.' && !seen_point) {
                seen_point = true;
            } else {
                break;
            }
        }
        if (digits.empty()) {
            throw ValueError("numeric literal has no digits: " + std::string(body));
        }

        long long exponent = 0;
        if (index < body.size() && (body[index] == 'e' || body[index] == 'E')) {
            ++index;
            bool exponent_negative = false;
            if (index < body.size() && (body[index] == '+' || body[index] == '-')) {
                exponent_negative = (body[index] == '-');
                ++index;
            }
            const std::size_t first = index;
            for (; index < body.size() && is_digit(body[index]); ++index) {
                exponent = exponent * 10 + (body[index] - '0');
                if (exponent > MAX_DECIMAL_EXPONENT) {
                    throw ValueError("decimal exponent out of range: " + std::string(body));
                }
            }
            if (index == first) {
                throw ValueError("exponent has no digits: " + std::string(body));
            }
            if (exponent_negative) {
                exponent = -exponent;
            }
        }
        if (index != body.size()) {
            throw ValueError("unexpected character in numeric literal: " + std::string(body));
        }

        bigint mantissa = io::parse_bigint(digits);
        if (negative) {
            mantissa = -mantissa;
        }
        const long long scale = exponent - fraction_digits;
        if (scale >= 0) {
            return from_rational(mantissa * power_of_ten(scale), bigint::one());
        }
        return from_rational(mantissa, power_of_ten(-scale));
    }

    std::string Number::to_decimal_string(std::optional<int> digits) const {
        const int count = digits ? *digits : decimal_digits_for(format_.fraction_bits());
        if (count < 0) {
            throw std::invalid_argument("digit count must be non-negative");
        }
        // |value| * 10^count, rounded half away from zero
        const bigint shifted = core::detail::round_shift_right(
            scaled_.abs() * power_of_ten(count), static_cast<std::size_t>(format_.fraction_bits()));

        std::string text = io::to_string(shifted);
        const auto fraction_width = static_cast<std::size_t>(count);
        pad_left(text, fraction_width + 1);
        std::string integer_part = text.substr(0, text.size() - fraction_width);
        std::string fraction_part = text.substr(text.size() - fraction_width);
        if (!digits) {
            const auto last = fraction_part.find_last_not_of('0');
            fraction_part.erase(last == std::string::npos ? 0 : last + 1);
        }

        std::string result;
        if (scaled_.is_negative() && !shifted.is_zero()) {
            result.push_back('-');
        }
        result += integer_part;
        if (!fraction_part.empty()) {
            result += '.';
            result += fraction_part;
        }
        return result;
    }

    std::string Number::to_binary_string(bool twos_complement) const {
        return radix_string(*this, 1, twos_complement);
    }

    std::string Number::to_octal_string(bool twos_complement) const {
        return radix_string(*this, 3, twos_complement);
    }

    std::string Number::to_hex_string(bool twos_complement) const {
        return radix_string(*this, 4, twos_complement);
    }

    std::string Number::to_repr() const {
        return "Number(" + io::to_string(scaled_) + ", " + format_.to_string() + ")";
    }

    Number Number::from_repr(std::string_view text) {
        ReprReader reader(text);
        reader.expect("Number(");
        const bigint scaled = io::parse_bigint(reader.integer_token());
        reader.expect(",");
        reader.expect("Format(");
        std::optional<int> integer_bits;
        if (!reader.accept("none")) {
            integer_bits = reader.small_integer();
        }
        reader.expect(",");
        const int fraction_bits = reader.small_integer();
        reader.expect(")");
        reader.expect(")");
        reader.finish();

        Format format = [&] {
            try {
                return Format(fraction_bits, integer_bits);
            } catch (const std::invalid_argument &error) {
                throw ValueError(std::string("invalid format in representation: ") + error.what());
            }
        }();
        return format.from_scaled(scaled);
    }

} // namespace fxpoint
