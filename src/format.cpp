#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "fxpoint/core/detail/rounding.hpp"
#include "fxpoint/core/detail/series.hpp"
#include "fxpoint/core/errors.hpp"
#include "fxpoint/format.hpp"
#include "fxpoint/number.hpp"

namespace fxpoint {

    struct Format::State {
        int fraction_bits = 0;
        std::optional<int> integer_bits;
        core::bigint scale;
        core::bigint min_scaled;
        core::bigint max_scaled;
        ConstantCache constants;
    };

    namespace {

        // Trusted bits lost by the series kernels, well below the guard width.
        constexpr int KERNEL_LOSS_BITS = 8;

        core::bigint compute_constant(Constant name, int bits) {
            switch (name) {
            case Constant::pi:
                return core::detail::compute_pi(bits);
            case Constant::ln2:
                return core::detail::compute_ln2(bits);
            case Constant::e:
                return core::detail::compute_e(bits);
            }
            throw std::invalid_argument("unknown constant");
        }

    } // namespace

    core::bigint ConstantCache::get(Constant name, int precision_bits) {
        if (precision_bits < 0) {
            throw std::invalid_argument("constant precision must be non-negative");
        }
        // The kernels never consult a cache, so computing under the lock is safe.
        std::lock_guard<std::mutex> lock(mutex_);
        Entry &entry = entries_[name];
        if (entry.precision < precision_bits) {
            const int bits = precision_bits + DEFAULT_GUARD_BITS;
            entry.value = compute_constant(name, bits);
            entry.bits = bits;
            entry.precision = bits - KERNEL_LOSS_BITS;
        }
        return core::detail::round_shift_right(
            entry.value, static_cast<std::size_t>(entry.bits - precision_bits));
    }

    int ConstantCache::cached_precision(Constant name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto found = entries_.find(name);
        return found == entries_.end() ? -1 : found->second.precision;
    }

    Format::Format(int fraction_bits, std::optional<int> integer_bits)
        : state_(std::make_shared<State>()) {
        if (fraction_bits < 0) {
            throw std::invalid_argument("fraction bits must be non-negative");
        }
        if (integer_bits) {
            if (*integer_bits < 0) {
                throw std::invalid_argument("integer bits must be non-negative");
            }
            if (*integer_bits + fraction_bits < 1) {
                throw std::invalid_argument("bounded format needs at least one bit");
            }
        }
        state_->fraction_bits = fraction_bits;
        state_->integer_bits = integer_bits;
        state_->scale = core::bigint::power_of_two(static_cast<std::size_t>(fraction_bits));
        if (integer_bits) {
            const auto total = static_cast<std::size_t>(*integer_bits + fraction_bits);
            const core::bigint half_range = core::bigint::power_of_two(total - 1);
            state_->max_scaled = half_range - core::bigint::one();
            state_->min_scaled = -half_range;
        }
    }

    Format Format::common(const Format &lhs, const Format &rhs) {
        const auto covers = [](const Format &wide, const Format &narrow) {
            if (wide.fraction_bits() < narrow.fraction_bits()) {
                return false;
            }
            if (!wide.is_bounded()) {
                return true;
            }
            return narrow.is_bounded() && *wide.integer_bits() >= *narrow.integer_bits();
        };
        if (covers(lhs, rhs)) {
            return lhs;
        }
        if (covers(rhs, lhs)) {
            return rhs;
        }
        std::optional<int> integer_bits;
        if (lhs.is_bounded() && rhs.is_bounded()) {
            integer_bits = std::max(*lhs.integer_bits(), *rhs.integer_bits());
        }
        return Format(std::max(lhs.fraction_bits(), rhs.fraction_bits()), integer_bits);
    }

    int Format::fraction_bits() const noexcept {
        return state_->fraction_bits;
    }

    std::optional<int> Format::integer_bits() const noexcept {
        return state_->integer_bits;
    }

    std::optional<int> Format::total_bits() const noexcept {
        if (!state_->integer_bits) {
            return std::nullopt;
        }
        return *state_->integer_bits + state_->fraction_bits;
    }

    bool Format::is_bounded() const noexcept {
        return state_->integer_bits.has_value();
    }

    const core::bigint &Format::scale() const noexcept {
        return state_->scale;
    }

    std::optional<core::bigint> Format::min_scaled() const {
        if (!is_bounded()) {
            return std::nullopt;
        }
        return state_->min_scaled;
    }

    std::optional<core::bigint> Format::max_scaled() const {
        if (!is_bounded()) {
            return std::nullopt;
        }
        return state_->max_scaled;
    }

    bool Format::fits(const core::bigint &scaled) const noexcept {
        if (!is_bounded()) {
            return true;
        }
        return scaled >= state_->min_scaled && scaled <= state_->max_scaled;
    }

    void Format::validate(const core::bigint &scaled) const {
        if (!fits(scaled)) {
            throw OverflowError("value exceeds the range of " + to_string());
        }
    }

    core::bigint Format::constant(Constant name, int precision_bits) const {
        return state_->constants.get(name, precision_bits);
    }

    int Format::cached_precision(Constant name) const {
        return state_->constants.cached_precision(name);
    }

    Number Format::from_int(const core::bigint &value) const {
        return Number(*this, value.shift_left(static_cast<std::size_t>(fraction_bits())));
    }

    Number Format::from_rational(const core::bigint &numerator, const core::bigint &denominator) const {
        if (denominator.is_zero()) {
            throw DivisionByZero();
        }
        const auto shift = static_cast<std::size_t>(fraction_bits());
        return Number(*this, core::detail::round_div(numerator.shift_left(shift), denominator));
    }

    Number Format::from_rational(std::int64_t numerator, std::int64_t denominator) const {
        return from_rational(core::bigint(numerator), core::bigint(denominator));
    }

    Number Format::from_double(double value) const {
        if (!std::isfinite(value)) {
            throw ValueError("cannot convert a non-finite double to fixed point");
        }
        if (value == 0.0) {
            return zero();
        }
        // value = mantissa * 2^exponent with 0.5 <= |mantissa| < 1, so
        // mantissa * 2^53 is an exact integer.
        int exponent = 0;
        const double mantissa = std::frexp(value, &exponent);
        const auto integral = static_cast<std::int64_t>(std::ldexp(mantissa, 53));
        return Number(*this, core::detail::rescale(core::bigint(integral),
                                                   53LL - exponent,
                                                   fraction_bits()));
    }

    Number Format::from_scaled(core::bigint scaled) const {
        return Number(*this, std::move(scaled));
    }

    Number Format::convert(const Number &value) const {
        return Number(*this, core::detail::rescale(value.scaled_value(),
                                                   value.format().fraction_bits(),
                                                   fraction_bits()));
    }

    Number Format::zero() const {
        return Number(*this, core::bigint::zero());
    }

    Number Format::one() const {
        return Number(*this, state_->scale);
    }

    Number Format::pi() const {
        return Number(*this, constant(Constant::pi, fraction_bits()));
    }

    Number Format::ln2() const {
        return Number(*this, constant(Constant::ln2, fraction_bits()));
    }

    Number Format::e() const {
        return Number(*this, constant(Constant::e, fraction_bits()));
    }

    std::string Format::to_string() const {
        const std::string integer_part =
            state_->integer_bits ? std::to_string(*state_->integer_bits) : std::string("none");
        return "Format(" + integer_part + ", " + std::to_string(state_->fraction_bits) + ")";
    }

    Format make_format(int integer_bits, int fraction_bits) {
        return Format(fraction_bits, integer_bits);
    }

} // namespace fxpoint
