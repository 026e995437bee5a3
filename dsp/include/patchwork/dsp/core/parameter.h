// ==============================================================================
// Layer 0: Core Utility - Signal and Parameter
// ==============================================================================
// Signal is a finite, fully materialized block of samples. Parameter is the
// value of a generator/filter input that is either one constant (broadcast to
// every sample) or one value per sample.
//
// A Parameter is bound to the length of the signal it modulates before the
// processing loop runs. Binding performs the length check once; the returned
// BoundParameter then reads value n without further branching on the kind.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/synth_error.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Patchwork {
namespace DSP {

/// @brief Ordered, fixed-length block of samples (implicit dt = 1 / sampleRate)
using Signal = std::vector<float>;

// =============================================================================
// BoundParameter
// =============================================================================

/// @brief Length-checked view of a Parameter with a broadcasting accessor
///
/// Refers to the storage of the Parameter it was bound from; the Parameter
/// must outlive it.
class BoundParameter {
public:
    /// @brief Value at sample n (the constant for a constant parameter)
    [[nodiscard]] float operator[](size_t n) const noexcept {
        return samples_ != nullptr ? samples_[n] : constant_;
    }

    [[nodiscard]] bool isConstant() const noexcept { return samples_ == nullptr; }

private:
    friend class Parameter;

    explicit BoundParameter(float constant) noexcept : constant_(constant) {}
    explicit BoundParameter(const float* samples) noexcept : samples_(samples) {}

    const float* samples_ = nullptr;
    float constant_ = 0.0f;
};

// =============================================================================
// Parameter
// =============================================================================

/// @brief Constant(value) | PerSample(signal)
///
/// @par Usage
/// @code
/// Signal t = timeVector(0.0, 1.0, 8000.0);
/// Signal y = sine(t, 440.0f);                      // constant frequency
/// Signal sweep = ...;                              // t.size() samples
/// Signal z = sine(t, sweep, 0.0f, 0.5f);           // per-sample frequency
/// @endcode
class Parameter {
public:
    /// @brief Constant parameter from any arithmetic value
    template <typename T>
        requires std::is_arithmetic_v<T>
    Parameter(T value) noexcept // NOLINT(google-explicit-constructor) scalar broadcast
        : value_(static_cast<float>(value)) {}

    /// @brief Per-sample parameter
    Parameter(Signal samples) // NOLINT(google-explicit-constructor) per-sample form
        : value_(std::move(samples)) {}

    [[nodiscard]] bool isConstant() const noexcept {
        return std::holds_alternative<float>(value_);
    }

    /// @brief The constant value
    /// @pre isConstant()
    [[nodiscard]] float constant() const { return std::get<float>(value_); }

    /// @brief The per-sample values
    /// @pre !isConstant()
    [[nodiscard]] const Signal& samples() const { return std::get<Signal>(value_); }

    /// @brief Number of per-sample values (0 for a constant)
    [[nodiscard]] size_t size() const noexcept {
        return isConstant() ? 0 : samples().size();
    }

    /// @brief Bind to a signal of exactly n samples
    /// @throws LengthMismatchError if per-sample and size() != n
    [[nodiscard]] BoundParameter bindExact(size_t n, const char* name) const {
        if (isConstant()) {
            return BoundParameter(constant());
        }
        if (samples().size() != n) {
            throw LengthMismatchError(std::string("per-sample parameter '") + name + "' has "
                                      + std::to_string(samples().size())
                                      + " samples, expected " + std::to_string(n));
        }
        return BoundParameter(samples().data());
    }

    /// @brief Bind for a recursion that reads indices [0, n)
    /// @throws IndexOutOfRangeError if per-sample and size() < n
    [[nodiscard]] BoundParameter bindAtLeast(size_t n, const char* name) const {
        if (isConstant()) {
            return BoundParameter(constant());
        }
        if (samples().size() < n) {
            throw IndexOutOfRangeError(std::string("per-sample parameter '") + name + "' has "
                                       + std::to_string(samples().size())
                                       + " samples, recursion reads " + std::to_string(n));
        }
        return BoundParameter(samples().data());
    }

    /// @brief Validate every value lies in [lo, hi]
    /// @throws InvalidArgumentError naming the first offending index
    void requireWithin(float lo, float hi, const char* name) const {
        if (isConstant()) {
            detail::requireInRange(constant(), lo, hi, name, 0);
            return;
        }
        const Signal& values = samples();
        for (size_t i = 0; i < values.size(); ++i) {
            detail::requireInRange(values[i], lo, hi, name, i);
        }
    }

private:
    std::variant<float, Signal> value_;
};

} // namespace DSP
} // namespace Patchwork
