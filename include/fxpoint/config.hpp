// include/fxpoint/config.hpp — Library version and compile-time defaults.

#pragma once

namespace fxpoint {

    inline constexpr int FXPOINT_VERSION_MAJOR = 0;
    inline constexpr int FXPOINT_VERSION_MINOR = 5;
    inline constexpr int FXPOINT_VERSION_PATCH = 0;

    // Fraction bits of a Format constructed without arguments.
    inline constexpr int DEFAULT_FRACTION_BITS = 64;

    // Extra fraction bits carried by series and iterative evaluations before
    // the result is rounded into its Format.
    inline constexpr int DEFAULT_GUARD_BITS = 16;

    // Largest decimal exponent accepted by the text parser.
    inline constexpr long long MAX_DECIMAL_EXPONENT = 100000;

    // Upper bound on the working resolution of exp and pow; results that
    // would need more are reported as overflow.
    inline constexpr long long MAX_WORKING_BITS = 1LL << 22;

} // namespace fxpoint
