// examples/example_pi_accuracy.cpp — Evaluates a few identities at growing precision.

#include <iostream>

#include <fxpoint/fxpoint.hpp>

int
main() {
    using fxpoint::Format;
    using fxpoint::Number;

    for (int bits : {32, 64, 128, 256}) {
        const Format fmt(bits);
        const Number pi = fmt.pi();
        // 4 atan(1) and 2 asin(1) land on the cached pi up to rounding.
        const Number via_atan = fmt.one().atan() << 2;
        const Number via_asin = fmt.one().asin() << 1;
        std::cout << "bits=" << bits << "\n";
        std::cout << "  pi         = " << pi << "\n";
        std::cout << "  4 atan(1)  - pi = " << (via_atan - pi).to_repr() << "\n";
        std::cout << "  2 asin(1)  - pi = " << (via_asin - pi).to_repr() << "\n";

        const Number root2 = fmt.from_int(2).sqrt();
        std::cout << "  sqrt(2)^2  = " << root2 * root2 << "\n";
        std::cout << "  ln(e)      = " << fmt.e().ln() << "\n";
        std::cout << "  exp(ln 10) = " << fmt.from_int(10).ln().exp() << "\n";
    }
    return 0;
}
