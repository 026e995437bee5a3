// ==============================================================================
// Layer 1: DSP Primitive - Noise Source
// ==============================================================================
// Stochastic generators:
// - White: independent uniform samples in [-1, 1]
// - Brown: cumulative sum of Gaussian increments
//
// Every generator takes the caller's Xorshift32 (so repeated trials continue
// one stream) or a seed (so one call is reproducible on its own).
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/defaults.h>
#include <patchwork/dsp/core/logging.h>
#include <patchwork/dsp/core/parameter.h>
#include <patchwork/dsp/core/random.h>
#include <patchwork/dsp/core/synth_error.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Patchwork {
namespace DSP {

/// @brief n samples drawn uniformly from [-1, 1]
[[nodiscard]] inline Signal whiteNoise(size_t n, Xorshift32& rng) {
    Signal x(n);
    for (auto& sample : x) {
        sample = rng.nextFloat();
    }
    return x;
}

/// @brief n uniform samples from a freshly seeded generator
[[nodiscard]] inline Signal whiteNoise(size_t n, uint32_t seed = kDefaultNoiseSeed) {
    Xorshift32 rng(seed);
    return whiteNoise(n, rng);
}

/// @brief Brown noise: x[0] = 0, x[n] = x[n-1] + Normal(0, sqrt(t[n]))
///
/// The increment's standard deviation is the square root of the absolute
/// timestamp t[n], not of the step size, so the walk spreads faster the
/// later the time vector starts.
///
/// @param t Time vector (timestamps from index 1 on must be >= 0)
/// @throws InvalidArgumentError if some t[n] < 0 for n >= 1
[[nodiscard]] inline Signal brownNoise(const Signal& t, Xorshift32& rng) {
    const size_t n = t.size();
    for (size_t i = 1; i < n; ++i) {
        if (!(t[i] >= 0.0f)) {
            throw InvalidArgumentError("brownNoise needs non-negative timestamps, t["
                                       + std::to_string(i) + "] = " + std::to_string(t[i]));
        }
    }
    logger()->debug("brownNoise: {} samples", n);

    Signal x(n, 0.0f);
    double walk = 0.0;
    for (size_t i = 1; i < n; ++i) {
        walk += rng.nextGaussian(std::sqrt(static_cast<double>(t[i])));
        x[i] = static_cast<float>(walk);
    }
    return x;
}

/// @brief Brown noise from a freshly seeded generator
[[nodiscard]] inline Signal brownNoise(const Signal& t, uint32_t seed = kDefaultNoiseSeed) {
    Xorshift32 rng(seed);
    return brownNoise(t, rng);
}

} // namespace DSP
} // namespace Patchwork
