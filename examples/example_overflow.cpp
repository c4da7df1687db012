// examples/example_overflow.cpp — Shows range checks and error reporting in a bounded format.

#include <iostream>
#include <stdexcept>

#include <fxpoint/fxpoint.hpp>

int
main() {
    using fxpoint::Format;
    using fxpoint::Number;

    const Format q8_8 = fxpoint::make_format(8, 8);
    std::cout << q8_8.to_string() << " holds [" << q8_8.from_scaled(*q8_8.min_scaled()) << ", "
              << q8_8.from_scaled(*q8_8.max_scaled()) << "]\n";

    Number value = q8_8.from_rational(3, 2);
    try {
        for (int step = 0;; ++step) {
            value *= value;
            std::cout << "step " << step << ": " << value << " (" << value.to_hex_string(true) << ")\n";
        }
    } catch (const fxpoint::OverflowError &err) {
        std::cout << "stopped: " << err.what() << "\n";
    }

    try {
        (void)q8_8.from_int(-1).sqrt();
    } catch (const fxpoint::DomainError &err) {
        std::cout << "sqrt(-1): " << err.what() << "\n";
    }

    try {
        (void)(q8_8.one() / q8_8.zero());
    } catch (const fxpoint::DivisionByZero &err) {
        std::cout << "1/0: " << err.what() << "\n";
    }

    try {
        (void)q8_8.from_string("12..5");
    } catch (const fxpoint::ValueError &err) {
        std::cout << "parse: " << err.what() << "\n";
    }

    // Largest integer argument whose exponential still fits each width.
    for (int integer_bits : {4, 8, 16, 32}) {
        const Format fmt = fxpoint::make_format(integer_bits, 16);
        int largest = 0;
        for (int n = 0;; ++n) {
            try {
                (void)fmt.from_int(n).exp();
                largest = n;
            } catch (const fxpoint::OverflowError &) {
                break;
            }
        }
        std::cout << fmt.to_string() << ": exp(" << largest << ") = " << fmt.from_int(largest).exp() << "\n";
    }

    // The same computation in an unbounded format keeps going.
    Number wide = Format(8).from_rational(3, 2);
    for (int step = 0; step < 6; ++step) {
        wide *= wide;
    }
    std::cout << "unbounded (3/2)^64 = " << wide.to_decimal_string(2) << "\n";
    return 0;
}
