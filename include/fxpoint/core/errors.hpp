// include/fxpoint/core/errors.hpp — Exception types raised by fixed-point operations.

#pragma once

#include <stdexcept>
#include <string>

namespace fxpoint {

    // Result or constructed value lies outside a bounded Format's range.
    class OverflowError : public std::overflow_error {
      public:
        using std::overflow_error::overflow_error;
    };

    // Operand lies outside the mathematical domain of a function.
    class DomainError : public std::domain_error {
      public:
        using std::domain_error::domain_error;
    };

    class DivisionByZero : public std::domain_error {
      public:
        DivisionByZero() : std::domain_error("fixed-point division by zero") {
        }
        using std::domain_error::domain_error;
    };

    // Malformed textual input or an unrepresentable native value.
    class ValueError : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

} // namespace fxpoint
