#pragma once

#include <ostream>

#include <fxpoint/core/bigint.hpp>
#include <fxpoint/format.hpp>
#include <fxpoint/io/format.hpp>
#include <fxpoint/number.hpp>

namespace fxpoint::util {

inline std::ostream& dump(std::ostream& os, const fxpoint::core::bigint& value) {
    return os << "bigint(" << fxpoint::io::to_string(value) << ')';
}

// Format(<integer_bits|none>, <fraction_bits>) followed by the precision of
// each cached constant, -1 when it has not been computed yet.
inline std::ostream& dump(std::ostream& os, const fxpoint::Format& format) {
    return os << format.to_string() << " cache{pi=" << format.cached_precision(Constant::pi)
              << ", ln2=" << format.cached_precision(Constant::ln2)
              << ", e=" << format.cached_precision(Constant::e) << '}';
}

inline std::ostream& dump(std::ostream& os, const fxpoint::Number& value) {
    return os << value.to_repr() << " = " << value.to_decimal_string();
}

} // namespace fxpoint::util
