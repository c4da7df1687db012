#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include <fxpoint/core/bigint.hpp>
#include <fxpoint/format.hpp>
#include <fxpoint/number.hpp>

namespace fxpoint::util {

inline fxpoint::core::bigint random_bigint(std::mt19937_64& generator,
                                           std::size_t limb_count,
                                           bool allow_negative = true) {
    if (limb_count == 0) {
        return fxpoint::core::bigint::zero();
    }
    std::uniform_int_distribution<fxpoint::core::detail::limb_t> limb_dist;
    std::vector<fxpoint::core::detail::limb_t> limbs(limb_count);
    for (auto& limb : limbs) {
        limb = limb_dist(generator);
    }
    bool negative = false;
    if (allow_negative) {
        std::bernoulli_distribution sign_dist(0.5);
        negative = sign_dist(generator);
    }
    return fxpoint::core::bigint::from_limbs(std::move(limbs), negative);
}

// Random scaled value strictly inside (-bound, bound), or [0, bound) without
// negatives, where bound = magnitude * 2^fraction_bits.
inline fxpoint::Number random_number(std::mt19937_64& generator,
                                     const fxpoint::Format& format,
                                     std::int64_t magnitude,
                                     bool allow_negative = true) {
    const std::size_t limbs =
        static_cast<std::size_t>(format.fraction_bits()) / fxpoint::core::detail::LIMB_BITS + 2;
    const fxpoint::core::bigint bound = format.scale() * fxpoint::core::bigint(magnitude);
    fxpoint::core::bigint raw = random_bigint(generator, limbs, allow_negative) % bound;
    return format.from_scaled(std::move(raw));
}

} // namespace fxpoint::util
