// ==============================================================================
// Layer 1: DSP Primitive - Oscillator Bank
// ==============================================================================
// Periodic waveform generators evaluated at the timestamps of a time vector.
// Frequency, phase, amplitude and duty cycle are Parameters: a constant or one
// value per sample (frequency/phase modulation, PWM).
//
// Phase is computed in double precision.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/defaults.h>
#include <patchwork/dsp/core/math_constants.h>
#include <patchwork/dsp/core/parameter.h>
#include <patchwork/dsp/core/synth_error.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Waveform Enumeration
// =============================================================================

/// @brief Waveforms selectable by index
enum class Waveform : uint8_t {
    Sine = 0,   ///< sin(2 pi f t + phi)
    Triangle,   ///< Symmetric triangle (sawtooth with width 0.5)
    Square      ///< 50% duty cycle pulse
};

/// @brief Number of waveforms in Waveform
inline constexpr size_t kNumWaveforms = 3;

namespace detail {

/// Phase 2 pi f t + phi wrapped into [0, 2 pi)
[[nodiscard]] inline double wrappedPhase(float t, float f, float phi) noexcept {
    double theta = std::fmod(kTwoPiD * static_cast<double>(f) * static_cast<double>(t)
                                 + static_cast<double>(phi),
                             kTwoPiD);
    if (theta < 0.0) {
        theta += kTwoPiD;
    }
    // A tiny negative remainder rounds up to exactly 2 pi
    if (theta >= kTwoPiD) {
        theta = 0.0;
    }
    return theta;
}

} // namespace detail

// =============================================================================
// Generators
// =============================================================================

/// @brief Sine oscillator: A * sin(2 pi f t + phi)
/// @throws LengthMismatchError if a per-sample parameter length != t.size()
[[nodiscard]] inline Signal sine(const Signal& t, const Parameter& f,
                                 const Parameter& phi = 0.0f, const Parameter& A = 1.0f) {
    const size_t n = t.size();
    const auto freq = f.bindExact(n, "f");
    const auto phase = phi.bindExact(n, "phi");
    const auto amp = A.bindExact(n, "A");

    Signal y(n);
    for (size_t i = 0; i < n; ++i) {
        const double arg = kTwoPiD * static_cast<double>(freq[i]) * static_cast<double>(t[i])
                           + static_cast<double>(phase[i]);
        y[i] = amp[i] * static_cast<float>(std::sin(arg));
    }
    return y;
}

/// @brief Pulse oscillator with duty cycle d
///
/// Output is +A for the first fraction d of each period and -A for the rest.
/// d = 0.5 is the canonical square wave; d = 0 is constantly -A and d = 1
/// constantly +A.
///
/// @throws InvalidArgumentError if any duty cycle value lies outside [0, 1]
/// @throws LengthMismatchError if a per-sample parameter length != t.size()
[[nodiscard]] inline Signal square(const Signal& t, const Parameter& f,
                                   const Parameter& d = kDefaultDutyCycle,
                                   const Parameter& phi = 0.0f, const Parameter& A = 1.0f) {
    const size_t n = t.size();
    d.requireWithin(0.0f, 1.0f, "d");
    const auto freq = f.bindExact(n, "f");
    const auto duty = d.bindExact(n, "d");
    const auto phase = phi.bindExact(n, "phi");
    const auto amp = A.bindExact(n, "A");

    Signal y(n);
    for (size_t i = 0; i < n; ++i) {
        const double theta = detail::wrappedPhase(t[i], freq[i], phase[i]);
        const bool high = theta < kTwoPiD * static_cast<double>(duty[i]);
        y[i] = high ? amp[i] : -amp[i];
    }
    return y;
}

/// @brief Sawtooth/triangle oscillator with rising-segment width d
///
/// Within each period the wave rises from -1 to +1 over the fraction d and
/// falls back over the remaining 1 - d. d = 0 gives a falling sawtooth,
/// d = 1 a rising sawtooth and d = 0.5 a symmetric triangle.
///
/// @throws InvalidArgumentError if any width value lies outside [0, 1]
/// @throws LengthMismatchError if a per-sample parameter length != t.size()
[[nodiscard]] inline Signal sawtooth(const Signal& t, const Parameter& f,
                                     const Parameter& d = kDefaultSawtoothWidth,
                                     const Parameter& phi = 0.0f, const Parameter& A = 1.0f) {
    const size_t n = t.size();
    d.requireWithin(0.0f, 1.0f, "d");
    const auto freq = f.bindExact(n, "f");
    const auto width = d.bindExact(n, "d");
    const auto phase = phi.bindExact(n, "phi");
    const auto amp = A.bindExact(n, "A");

    Signal y(n);
    for (size_t i = 0; i < n; ++i) {
        const double theta = detail::wrappedPhase(t[i], freq[i], phase[i]);
        const double w = static_cast<double>(width[i]);
        double value;
        if (theta < kTwoPiD * w) {
            value = theta / (kPiD * w) - 1.0;
        } else {
            value = (kPiD * (w + 1.0) - theta) / (kPiD * (1.0 - w));
        }
        y[i] = amp[i] * static_cast<float>(value);
    }
    return y;
}

/// @brief Symmetric triangle: sawtooth with width 0.5
[[nodiscard]] inline Signal triangle(const Signal& t, const Parameter& f,
                                     const Parameter& phi = 0.0f, const Parameter& A = 1.0f) {
    return sawtooth(t, f, 0.5f, phi, A);
}

/// @brief Evaluate the selected waveform
[[nodiscard]] inline Signal oscillator(Waveform waveform, const Signal& t, const Parameter& f,
                                       const Parameter& phi = 0.0f, const Parameter& A = 1.0f) {
    switch (waveform) {
        case Waveform::Sine:
            return sine(t, f, phi, A);
        case Waveform::Triangle:
            return triangle(t, f, phi, A);
        case Waveform::Square:
            return square(t, f, kDefaultDutyCycle, phi, A);
    }
    throw InvalidArgumentError("unknown waveform index "
                               + std::to_string(static_cast<int>(waveform)));
}

/// @brief Map an integer index onto Waveform
/// @throws InvalidArgumentError if index >= kNumWaveforms
[[nodiscard]] inline Waveform waveformFromIndex(int index) {
    if (index < 0 || static_cast<size_t>(index) >= kNumWaveforms) {
        throw InvalidArgumentError("waveform index " + std::to_string(index)
                                   + " is outside [0, " + std::to_string(kNumWaveforms - 1) + "]");
    }
    return static_cast<Waveform>(index);
}

} // namespace DSP
} // namespace Patchwork
