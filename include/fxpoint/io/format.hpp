// include/fxpoint/io/format.hpp — Rendering bigint values as digit strings.

#pragma once

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fxpoint/core/bigint.hpp>

namespace fxpoint::io {

    namespace detail {

        inline char digit_char(int value) noexcept {
            if (value < 10) {
                return static_cast<char>('0' + value);
            }
            return static_cast<char>('a' + value - 10);
        }

        inline int digit_value(char ch) noexcept {
            if (ch >= '0' && ch <= '9') {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'z') {
                return 10 + (ch - 'a');
            }
            if (ch >= 'A' && ch <= 'Z') {
                return 10 + (ch - 'A');
            }
            return -1;
        }

        // Largest power of base that fits in one limb, with its digit count.
        inline std::pair<core::detail::limb_t, int> limb_chunk(int base) noexcept {
            core::detail::wide_t chunk = static_cast<core::detail::wide_t>(base);
            int digits = 1;
            while (chunk * static_cast<core::detail::wide_t>(base) <= core::detail::LIMB_MASK) {
                chunk *= static_cast<core::detail::wide_t>(base);
                ++digits;
            }
            return {static_cast<core::detail::limb_t>(chunk), digits};
        }

    } // namespace detail

    inline std::string to_string(const core::bigint &value, int base = 10) {
        if (base < 2 || base > 36) {
            throw std::invalid_argument("supported bases are 2..36");
        }
        if (value.is_zero()) {
            return "0";
        }
        const auto [chunk, chunk_digits] = detail::limb_chunk(base);
        const auto base_limb = static_cast<core::detail::limb_t>(base);
        core::bigint cursor = value.abs();
        std::string digits;
        while (!cursor.is_zero()) {
            auto [quotient, remainder] = core::bigint::div_mod_small(cursor, chunk);
            cursor = std::move(quotient);
            for (int index = 0; index < chunk_digits; ++index) {
                if (cursor.is_zero() && remainder == 0) {
                    break;
                }
                digits.push_back(detail::digit_char(static_cast<int>(remainder % base_limb)));
                remainder /= base_limb;
            }
        }
        if (value.is_negative()) {
            digits.push_back('-');
        }
        std::reverse(digits.begin(), digits.end());
        return digits;
    }

    inline std::ostream &operator<<(std::ostream &os, const core::bigint &value) {
        return os << to_string(value);
    }

} // namespace fxpoint::io
