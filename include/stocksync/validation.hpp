#pragma once

#include <cstdint>
#include <string>
#include "errors.hpp"
#include "types.hpp"

namespace stocksync {
namespace validation {

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " is required");
    }
}

/**
 * Require that a quantity fits the supported magnitude. Integer inputs cannot
 * be NaN or infinite, so an out-of-range magnitude is the non-finite case.
 */
inline void require_finite(Quantity value, const std::string& field_name = "quantity") {
    if (value > kMaxQuantityMagnitude || value < -kMaxQuantityMagnitude) {
        throw InvalidQuantityError(field_name + " must be a finite number");
    }
}

/**
 * Require that a quantity is positive (greater than zero).
 */
inline void require_positive(Quantity value, const std::string& field_name = "quantity") {
    require_finite(value, field_name);
    if (value <= 0) {
        throw InvalidQuantityError(field_name + " must be a positive number");
    }
}

/**
 * Require that a quantity is non-negative (zero or greater).
 */
inline void require_non_negative(Quantity value, const std::string& field_name = "quantity") {
    require_finite(value, field_name);
    if (value < 0) {
        throw InvalidQuantityError(field_name + " must be non-negative");
    }
}

} // namespace validation
} // namespace stocksync
