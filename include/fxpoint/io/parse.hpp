#pragma once

#include <cstdint>
#include <stdexcept>
#include <string_view>

#include <fxpoint/core/bigint.hpp>
#include <fxpoint/io/format.hpp>

namespace fxpoint::io {

// Parses an optionally signed digit string in the given base.
inline core::bigint parse_bigint(std::string_view text, int base = 10) {
    if (base < 2 || base > 36) {
        throw std::invalid_argument("supported bases are 2..36");
    }
    if (text.empty()) {
        throw std::invalid_argument("empty string");
    }
    std::size_t index = 0;
    bool negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = (text[0] == '-');
        ++index;
        if (index == text.size()) {
            throw std::invalid_argument("string has only a sign");
        }
    }
    const int chunk_digits = detail::limb_chunk(base).second;
    core::bigint accumulator = core::bigint::zero();
    while (index < text.size()) {
        std::uint64_t chunk_value = 0;
        std::uint64_t chunk_scale = 1;
        for (int offset = 0; offset < chunk_digits && index < text.size(); ++offset, ++index) {
            const int digit = detail::digit_value(text[index]);
            if (digit < 0 || digit >= base) {
                throw std::invalid_argument("invalid digit in string");
            }
            chunk_value = chunk_value * static_cast<std::uint64_t>(base) +
                          static_cast<std::uint64_t>(digit);
            chunk_scale *= static_cast<std::uint64_t>(base);
        }
        accumulator *= core::bigint(chunk_scale);
        if (chunk_value != 0) {
            accumulator += core::bigint(chunk_value);
        }
    }
    if (negative) {
        accumulator = -accumulator;
    }
    return accumulator;
}

} // namespace fxpoint::io
