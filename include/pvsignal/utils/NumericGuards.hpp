#ifndef PVSIGNAL_NUMERIC_GUARDS_HPP
#define PVSIGNAL_NUMERIC_GUARDS_HPP

#include "pvsignal/exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace pvsignal {

/**
 * @brief Returns value unchanged, or throws NumericOverflowException if it is NaN or infinite
 */
inline double requireFinite(double value, const std::string& source, const std::string& what) {
    if (!std::isfinite(value)) {
        throw NumericOverflowException(source, what + " is not finite");
    }
    return value;
}

inline double clamp01(double value) {
    return std::clamp(value, 0.0, 1.0);
}

} // namespace pvsignal

#endif // PVSIGNAL_NUMERIC_GUARDS_HPP
