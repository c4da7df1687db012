// include/fxpoint/format.hpp — Fixed-point Format descriptor and its per-format constant cache.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

#include <fxpoint/config.hpp>
#include <fxpoint/core/bigint.hpp>

namespace fxpoint {

    class Number;

    enum class Constant { pi, ln2, e };

    // Lazily computed mathematical constants. Each entry holds the most
    // precise value computed so far; lower precisions are served from it.
    class ConstantCache {
      public:
        ConstantCache() = default;
        ConstantCache(const ConstantCache &) = delete;
        ConstantCache &operator=(const ConstantCache &) = delete;

        // Value of name scaled by 2^precision_bits.
        core::bigint get(Constant name, int precision_bits);

        // Precision of the cached entry, or -1 when nothing is cached.
        int cached_precision(Constant name) const;

      private:
        // value is scaled by 2^bits and trusted to precision bits.
        struct Entry {
            int precision = -1;
            int bits = 0;
            core::bigint value;
        };

        mutable std::mutex mutex_;
        std::unordered_map<Constant, Entry> entries_;
    };

    // Immutable description of a fixed-point representation: fraction bits
    // and an optional bound on integer bits. Copies share one underlying
    // state, including the constant cache.
    class Format {
      public:
        explicit Format(int fraction_bits = DEFAULT_FRACTION_BITS,
                        std::optional<int> integer_bits = std::nullopt);

        static Format unbounded(int fraction_bits) {
            return Format(fraction_bits, std::nullopt);
        }

        // The wider of two formats: most fraction bits and most integer bits
        // (unbounded wins). Reuses an operand's state when it already covers both.
        static Format common(const Format &lhs, const Format &rhs);

        int fraction_bits() const noexcept;
        std::optional<int> integer_bits() const noexcept;
        std::optional<int> total_bits() const noexcept;
        bool is_bounded() const noexcept;

        const core::bigint &scale() const noexcept;
        std::optional<core::bigint> min_scaled() const;
        std::optional<core::bigint> max_scaled() const;

        bool fits(const core::bigint &scaled) const noexcept;
        // Throws OverflowError when scaled lies outside a bounded range.
        void validate(const core::bigint &scaled) const;

        core::bigint constant(Constant name, int precision_bits) const;
        int cached_precision(Constant name) const;

        template <typename Int, typename = std::enable_if_t<std::is_integral_v<Int>>>
        Number from_int(Int value) const;
        Number from_int(const core::bigint &value) const;
        Number from_rational(const core::bigint &numerator, const core::bigint &denominator) const;
        Number from_rational(std::int64_t numerator, std::int64_t denominator) const;
        Number from_string(std::string_view text) const;
        Number from_double(double value) const;
        Number from_scaled(core::bigint scaled) const;
        Number convert(const Number &value) const;

        Number zero() const;
        Number one() const;
        Number pi() const;
        Number ln2() const;
        Number e() const;

        std::string to_string() const;

        bool shares_state_with(const Format &other) const noexcept {
            return state_ == other.state_;
        }

        friend bool operator==(const Format &lhs, const Format &rhs) noexcept {
            return lhs.fraction_bits() == rhs.fraction_bits() &&
                   lhs.integer_bits() == rhs.integer_bits();
        }

      private:
        struct State;

        std::shared_ptr<State> state_;
    };

    // Bounded format with the given integer and fraction bit counts.
    Format make_format(int integer_bits, int fraction_bits);

} // namespace fxpoint
