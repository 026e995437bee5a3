// ==============================================================================
// Layer 2: DSP Processor - Signal Utilities
// ==============================================================================
// Whole-signal helpers used between generators and filters:
// - amplifier: VCA, gain * x1 * x2 + bias with broadcasting operands
// - normalize: scale so the peak of larger magnitude maps to +/-1
// - gate: binary threshold
// - sampleAndHold: zero-order hold at a coarser rate
//
// The element-wise paths run on the Highway kernels in core/signal_simd.h.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/defaults.h>
#include <patchwork/dsp/core/logging.h>
#include <patchwork/dsp/core/parameter.h>
#include <patchwork/dsp/core/signal_simd.h>
#include <patchwork/dsp/core/synth_error.h>
#include <patchwork/dsp/primitives/time_base.h>

#include <algorithm>
#include <cfloat>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <string>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Amplifier
// =============================================================================

/// @brief Voltage-controlled amplifier: gain * x1 * x2 + bias
///
/// Every operand is a Parameter; constants broadcast against the per-sample
/// operands, whose common length is the output length.
///
/// @throws InvalidArgumentError if no operand is per-sample
/// @throws LengthMismatchError if per-sample operands differ in length
[[nodiscard]] inline Signal amplifier(const Parameter& x1, const Parameter& x2,
                                      const Parameter& gain = 1.0f,
                                      const Parameter& bias = 0.0f) {
    const Parameter* operands[] = {&x1, &x2, &gain, &bias};
    const auto firstPerSample = std::find_if(std::begin(operands), std::end(operands),
                                             [](const Parameter* p) { return !p->isConstant(); });
    if (firstPerSample == std::end(operands)) {
        throw InvalidArgumentError("amplifier needs at least one per-sample operand");
    }
    const size_t n = (*firstPerSample)->size();

    const auto a = x1.bindExact(n, "x1");
    const auto b = x2.bindExact(n, "x2");
    const auto g = gain.bindExact(n, "gain");
    const auto c = bias.bindExact(n, "bias");

    Signal y(n);
    if (!a.isConstant() && !b.isConstant() && g.isConstant() && c.isConstant()) {
        multiplyAddBulk(x1.samples().data(), x2.samples().data(), gain.constant(),
                        bias.constant(), y.data(), n);
        return y;
    }
    for (size_t i = 0; i < n; ++i) {
        y[i] = g[i] * a[i] * b[i] + c[i];
    }
    return y;
}

// =============================================================================
// Normalize
// =============================================================================

/// @brief Divide by whichever of max(x), min(x) has the larger magnitude
///
/// The extremum keeps its sign, so a signal whose dominant peak is negative
/// is flipped: that peak maps to +1. Ties resolve to max.
///
/// @throws ArithmeticDegeneracyError if x is empty or all zero
[[nodiscard]] inline Signal normalize(const Signal& x) {
    if (x.empty()) {
        throw ArithmeticDegeneracyError("cannot normalize an empty signal");
    }
    float lo = 0.0f;
    float hi = 0.0f;
    findMinMaxBulk(x.data(), x.size(), &lo, &hi);

    const float m = (std::abs(hi) >= std::abs(lo)) ? hi : lo;
    if (m == 0.0f) {
        throw ArithmeticDegeneracyError("cannot normalize a signal of "
                                        + std::to_string(x.size()) + " zero samples");
    }
    logger()->debug("normalize: {} samples, min={} max={} divisor={}", x.size(), lo, hi, m);

    Signal y(x.size());
    divideBulk(x.data(), m, y.data(), x.size());
    return y;
}

// =============================================================================
// Gate
// =============================================================================

/// @brief 1 where x >= threshold, 0 elsewhere
[[nodiscard]] inline Signal gate(const Signal& x, float threshold = kDefaultGateThreshold) {
    Signal y(x.size());
    thresholdBulk(x.data(), threshold, y.data(), x.size());
    return y;
}

// =============================================================================
// Sample and Hold
// =============================================================================

/// @brief Resample x at `hold` samples per second and hold each value
///
/// The coarse grid is timeVector(t[0], t.back() - t[0], hold): it starts at
/// t[0], ends on t.back() and uses the same linspace spacing as the input, so
/// a hold rate equal to the sample rate of t reproduces x. A grid of fewer
/// than two points collapses to t[0] alone. Each grid point takes the last x
/// whose timestamp is not later than it; each output sample then takes the
/// last grid value not later than its own timestamp.
///
/// @param t Time vector (non-decreasing)
/// @param x Signal sampled at t
/// @param hold Hold rate in Hz (> 0)
/// @return Signal with t.size() samples
/// @throws LengthMismatchError if t.size() != x.size()
/// @throws InvalidArgumentError if hold <= 0, t decreases or the grid would
///         exceed the maximum signal length
[[nodiscard]] inline Signal sampleAndHold(const Signal& t, const Signal& x, double hold) {
    detail::requirePositive(hold, "hold");
    if (t.size() != x.size()) {
        throw LengthMismatchError("sampleAndHold: t has " + std::to_string(t.size())
                                  + " samples, x has " + std::to_string(x.size()));
    }
    const size_t n = t.size();
    if (n == 0) {
        return {};
    }
    float minStep = 0.0f;
    for (size_t i = 1; i < n; ++i) {
        const float step = t[i] - t[i - 1];
        if (step < 0.0f) {
            throw InvalidArgumentError("sampleAndHold needs a non-decreasing time vector, t["
                                       + std::to_string(i) + "] < t["
                                       + std::to_string(i - 1) + "]");
        }
        if (step > 0.0f && (minStep == 0.0f || step < minStep)) {
            minStep = step;
        }
    }

    const double t0 = t.front();
    const double tEnd = t.back();
    Signal grid;
    if (tEnd > t0) {
        grid = timeVector(t0, tEnd - t0, hold);
    }
    if (grid.size() < 2) {
        grid.assign(1, t.front());
    }

    // Float rounding slack on timestamps, kept below half the finest input step
    const float scale = static_cast<float>(std::max(std::abs(t0), std::abs(tEnd)));
    float tolerance = 4.0f * FLT_EPSILON * scale;
    if (minStep > 0.0f) {
        tolerance = std::min(tolerance, 0.5f * minStep);
    }

    // Decimate: grid values by zero-order hold on (t, x)
    Signal held(grid.size());
    size_t i = 0;
    for (size_t k = 0; k < grid.size(); ++k) {
        while (i + 1 < n && t[i + 1] <= grid[k] + tolerance) {
            ++i;
        }
        held[k] = x[i];
    }

    logger()->debug("sampleAndHold: {} samples, {} held values at {} Hz", n, held.size(), hold);

    // Reconstruct: zero-order hold of the grid values back onto t
    Signal y(n);
    size_t k = 0;
    for (size_t j = 0; j < n; ++j) {
        while (k + 1 < grid.size() && grid[k + 1] <= t[j] + tolerance) {
            ++k;
        }
        y[j] = held[k];
    }
    return y;
}

} // namespace DSP
} // namespace Patchwork
