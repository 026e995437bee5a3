// ==============================================================================
// Layer 1: DSP Primitive - Time Base
// ==============================================================================
// Uniformly spaced time vectors, the leaf input of every generator.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/logging.h>
#include <patchwork/dsp/core/parameter.h>
#include <patchwork/dsp/core/synth_error.h>

#include <cmath>
#include <cstddef>
#include <string>

namespace Patchwork {
namespace DSP {

/// @brief Number of samples in a time vector: floor(duration * sampleRate)
/// @throws InvalidArgumentError if duration or sampleRate is not positive, or
///         the count exceeds what a Signal can hold
[[nodiscard]] inline size_t sampleCount(double duration, double sampleRate) {
    detail::requirePositive(duration, "duration");
    detail::requirePositive(sampleRate, "sampleRate");
    const double count = std::floor(duration * sampleRate);
    if (!(count <= static_cast<double>(Signal().max_size()))) {
        throw InvalidArgumentError("duration * sampleRate = " + std::to_string(count)
                                   + " exceeds the maximum signal length");
    }
    return static_cast<size_t>(count);
}

/// @brief Evenly spaced timestamps from t0 to t0 + duration, both inclusive
///
/// Produces N = floor(duration * sampleRate) samples with step
/// duration / (N - 1), so the last sample lands exactly on t0 + duration.
/// A single-sample vector holds t0; N = 0 yields an empty vector.
///
/// @param t0 Start time in seconds
/// @param duration Length in seconds (> 0)
/// @param sampleRate Samples per second (> 0)
/// @throws InvalidArgumentError on non-positive duration/sampleRate or non-finite t0
[[nodiscard]] inline Signal timeVector(double t0, double duration, double sampleRate) {
    if (!std::isfinite(t0)) {
        throw InvalidArgumentError("t0 must be finite, got " + std::to_string(t0));
    }
    const size_t n = sampleCount(duration, sampleRate);
    logger()->debug("timeVector: t0={} duration={} sampleRate={} -> {} samples",
                    t0, duration, sampleRate, n);

    Signal t(n);
    if (n == 0) {
        return t;
    }
    if (n == 1) {
        t[0] = static_cast<float>(t0);
        return t;
    }

    const double step = duration / static_cast<double>(n - 1);
    for (size_t i = 0; i + 1 < n; ++i) {
        t[i] = static_cast<float>(t0 + static_cast<double>(i) * step);
    }
    t[n - 1] = static_cast<float>(t0 + duration);
    return t;
}

} // namespace DSP
} // namespace Patchwork
