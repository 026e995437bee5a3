// ==============================================================================
// Layer 0: Core Utility - Error Types
// ==============================================================================
// Exceptions thrown by the batch operations when a precondition fails.
//
// Every error derives from the matching standard exception, so callers can
// catch either the Patchwork type or the std:: base:
//   InvalidArgumentError       -> std::invalid_argument
//   ArithmeticDegeneracyError  -> std::domain_error
//   LengthMismatchError        -> std::length_error
//   IndexOutOfRangeError       -> std::out_of_range
//
// Errors are raised at the first violated precondition, before any output
// is produced. Per-sample processing paths (process()) stay noexcept.
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace Patchwork {
namespace DSP {

/// @brief Argument outside its valid domain (duty cycle, sample rate, ...)
class InvalidArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// @brief Operation undefined for the given data (normalize on silence)
class ArithmeticDegeneracyError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

/// @brief Per-sample operand whose length differs from the target signal
class LengthMismatchError : public std::length_error {
public:
    using std::length_error::length_error;
};

/// @brief Per-sample coefficient array too short for the recursion
class IndexOutOfRangeError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

namespace detail {

/// Throw InvalidArgumentError unless value is finite and > 0
inline void requirePositive(double value, const char* name) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw InvalidArgumentError(std::string(name) + " must be positive and finite, got "
                                   + std::to_string(value));
    }
}

/// Throw InvalidArgumentError unless lo <= value <= hi (NaN fails)
inline void requireInRange(float value, float lo, float hi, const char* name, size_t index) {
    if (!(value >= lo && value <= hi)) {
        throw InvalidArgumentError(std::string(name) + "[" + std::to_string(index)
                                   + "] = " + std::to_string(value) + " is outside ["
                                   + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

} // namespace detail

} // namespace DSP
} // namespace Patchwork
