// ==============================================================================
// Layer 1: DSP Primitive - Recursive Filter
// recursive_filter.h - 4th-Order One-Pole Cascades (Low-Pass, High-Pass)
// ==============================================================================
// Two causal 4th-order filters, each four coupled one-pole stages with
// feedback k from the last stage into the first. Cutoff fc and feedback k
// may change every sample.
//
// The state of one sample index is an explicit FilterState value. Pure step
// functions advance it by one sample; the batch functions fold them over a
// whole Signal, and LowpassCascade/HighpassCascade wrap the same steps for
// sample-by-sample use.
//
// The recursions are strictly sequential: sample n+1 needs sample n.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/logging.h>
#include <patchwork/dsp/core/math_constants.h>
#include <patchwork/dsp/core/parameter.h>
#include <patchwork/dsp/core/synth_error.h>

#include <algorithm>
#include <cstddef>

namespace Patchwork {
namespace DSP {

// =============================================================================
// FilterState
// =============================================================================

/// @brief Outputs of the four cascade stages at one sample index
struct FilterState {
    float y1 = 0.0f;
    float y2 = 0.0f;
    float y3 = 0.0f;
    float y4 = 0.0f;

    [[nodiscard]] constexpr float output() const noexcept { return y4; }

    [[nodiscard]] constexpr bool operator==(const FilterState&) const noexcept = default;
};

// =============================================================================
// Low-Pass Steps
// =============================================================================

/// @brief Initial low-pass state: every stage scales the previous by w/(1+w)
/// @param x0 First input sample
/// @param fc0 First cutoff (Hz), w = 2 pi fc0
[[nodiscard]] constexpr FilterState lowpassInitial(float x0, float fc0) noexcept {
    const float omega = kTwoPi * fc0;
    const float g = omega / (1.0f + omega);
    FilterState s;
    s.y1 = g * x0;
    s.y2 = g * s.y1;
    s.y3 = g * s.y2;
    s.y4 = g * s.y3;
    return s;
}

/// @brief Advance the low-pass cascade from sample n to n+1
///
/// y1' = y1 + dt w (x - y1 - k y4), yi' = yi + dt w (y(i-1) - yi)
/// All right-hand sides read the state at n.
///
/// @param s State at n
/// @param x Input x[n]
/// @param fc Cutoff fc[n] in Hz
/// @param k Feedback k[n]
/// @param dt Sample period (1 / sampleRate)
[[nodiscard]] constexpr FilterState lowpassStep(const FilterState& s, float x, float fc,
                                                float k, float dt) noexcept {
    const float a = dt * kTwoPi * fc;
    FilterState next;
    next.y1 = s.y1 + a * (x - s.y1 - k * s.y4);
    next.y2 = s.y2 + a * (s.y1 - s.y2);
    next.y3 = s.y3 + a * (s.y2 - s.y3);
    next.y4 = s.y4 + a * (s.y3 - s.y4);
    return next;
}

// =============================================================================
// High-Pass Steps
// =============================================================================

/// @brief Initial high-pass state: every stage starts at x0
[[nodiscard]] constexpr FilterState highpassInitial(float x0) noexcept {
    return FilterState{x0, x0, x0, x0};
}

/// @brief Advance the high-pass cascade from sample n to n+1
///
/// alpha = 1 / (2 pi dt fc + 1);
/// y1' = alpha (y1 + x[n+1] - x[n] - k y4), yi' = alpha (yi + y(i-1)' - y(i-1))
///
/// @param s State at n
/// @param xPrev Input x[n]
/// @param xNext Input x[n+1]
/// @param fc Cutoff fc[n] in Hz
/// @param k Feedback k[n]
/// @param dt Sample period (1 / sampleRate)
[[nodiscard]] constexpr FilterState highpassStep(const FilterState& s, float xPrev, float xNext,
                                                 float fc, float k, float dt) noexcept {
    const float alpha = 1.0f / (kTwoPi * dt * fc + 1.0f);
    FilterState next;
    next.y1 = alpha * (s.y1 + xNext - xPrev - k * s.y4);
    next.y2 = alpha * (s.y2 + next.y1 - s.y1);
    next.y3 = alpha * (s.y3 + next.y2 - s.y2);
    next.y4 = alpha * (s.y4 + next.y3 - s.y3);
    return next;
}

// =============================================================================
// Batch Filters
// =============================================================================

/// @brief 4th-order low-pass over a whole signal
///
/// @param x Input signal
/// @param fc Cutoff in Hz; per-sample arrays need max(N-1, 1) values
/// @param k Feedback; per-sample arrays need N-1 values. Resonance grows
///          with k toward self-oscillation.
/// @param sampleRate Samples per second (> 0)
/// @return y4 for every sample index, same length as x
/// @throws InvalidArgumentError if sampleRate <= 0
/// @throws IndexOutOfRangeError if fc or k is per-sample and too short
[[nodiscard]] inline Signal lowpass(const Signal& x, const Parameter& fc, const Parameter& k,
                                   double sampleRate) {
    detail::requirePositive(sampleRate, "sampleRate");
    const size_t n = x.size();
    if (n == 0) {
        return {};
    }
    // Initial condition reads fc[0] even for a single sample
    const auto cutoff = fc.bindAtLeast(std::max<size_t>(n - 1, 1), "fc");
    const auto feedback = k.bindAtLeast(n - 1, "k");
    const auto dt = static_cast<float>(1.0 / sampleRate);

    logger()->debug("lowpass: {} samples at {} Hz", n, sampleRate);

    Signal y(n);
    FilterState state = lowpassInitial(x[0], cutoff[0]);
    y[0] = state.output();

    bool warned = false;
    for (size_t i = 0; i + 1 < n; ++i) {
        if (!warned && dt * kTwoPi * cutoff[i] > 1.0f) {
            logger()->warn("lowpass: fc[{}] = {} Hz exceeds sampleRate / 2pi, "
                           "the cascade overshoots and may diverge",
                           i, cutoff[i]);
            warned = true;
        }
        state = lowpassStep(state, x[i], cutoff[i], feedback[i], dt);
        y[i + 1] = state.output();
    }
    return y;
}

/// @brief 4th-order high-pass over a whole signal
///
/// @param x Input signal
/// @param fc Cutoff in Hz; per-sample arrays need N-1 values
/// @param k Feedback; per-sample arrays need N-1 values
/// @param sampleRate Samples per second (> 0)
/// @return y4 for every sample index, same length as x
/// @throws InvalidArgumentError if sampleRate <= 0
/// @throws IndexOutOfRangeError if fc or k is per-sample and too short
[[nodiscard]] inline Signal highpass(const Signal& x, const Parameter& fc, const Parameter& k,
                                    double sampleRate) {
    detail::requirePositive(sampleRate, "sampleRate");
    const size_t n = x.size();
    if (n == 0) {
        return {};
    }
    const auto cutoff = fc.bindAtLeast(n - 1, "fc");
    const auto feedback = k.bindAtLeast(n - 1, "k");
    const auto dt = static_cast<float>(1.0 / sampleRate);

    logger()->debug("highpass: {} samples at {} Hz", n, sampleRate);

    Signal y(n);
    FilterState state = highpassInitial(x[0]);
    y[0] = state.output();
    for (size_t i = 0; i + 1 < n; ++i) {
        state = highpassStep(state, x[i], x[i + 1], cutoff[i], feedback[i], dt);
        y[i + 1] = state.output();
    }
    return y;
}

// =============================================================================
// Incremental Cascades
// =============================================================================

/// @brief Sample-by-sample low-pass producing the same sequence as lowpass()
///
/// Output n is y4[n]; the input, cutoff and feedback passed with sample n
/// are held and consumed when sample n+1 arrives.
///
/// @par Usage
/// @code
/// LowpassCascade filter;
/// filter.prepare(8000.0);
/// for (float sample : input) {
///     out.push_back(filter.process(sample, 200.0f, 0.5f));
/// }
/// @endcode
class LowpassCascade {
public:
    LowpassCascade() noexcept = default;

    /// @brief Set the sample rate and clear the state
    /// @throws InvalidArgumentError if sampleRate <= 0
    void prepare(double sampleRate) {
        detail::requirePositive(sampleRate, "sampleRate");
        dt_ = static_cast<float>(1.0 / sampleRate);
        prepared_ = true;
        reset();
    }

    /// @brief Forget all samples; the next process() call is sample 0
    void reset() noexcept {
        state_ = FilterState{};
        started_ = false;
    }

    /// @brief Process one sample
    /// @return y4 at this sample index; the input unchanged if not prepared
    [[nodiscard]] float process(float x, float fc, float k) noexcept {
        if (!prepared_) return x;

        if (!started_) {
            state_ = lowpassInitial(x, fc);
            started_ = true;
        } else {
            state_ = lowpassStep(state_, heldX_, heldFc_, heldK_, dt_);
        }
        heldX_ = x;
        heldFc_ = fc;
        heldK_ = k;
        return state_.output();
    }

    [[nodiscard]] const FilterState& state() const noexcept { return state_; }
    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

private:
    FilterState state_;
    float dt_ = 0.0f;
    float heldX_ = 0.0f;
    float heldFc_ = 0.0f;
    float heldK_ = 0.0f;
    bool prepared_ = false;
    bool started_ = false;
};

/// @brief Sample-by-sample high-pass producing the same sequence as highpass()
///
/// Cutoff and feedback passed with sample n shape the step from n to n+1,
/// so they take effect on the following call.
class HighpassCascade {
public:
    HighpassCascade() noexcept = default;

    /// @brief Set the sample rate and clear the state
    /// @throws InvalidArgumentError if sampleRate <= 0
    void prepare(double sampleRate) {
        detail::requirePositive(sampleRate, "sampleRate");
        dt_ = static_cast<float>(1.0 / sampleRate);
        prepared_ = true;
        reset();
    }

    /// @brief Forget all samples; the next process() call is sample 0
    void reset() noexcept {
        state_ = FilterState{};
        started_ = false;
    }

    /// @brief Process one sample
    /// @return y4 at this sample index; the input unchanged if not prepared
    [[nodiscard]] float process(float x, float fc, float k) noexcept {
        if (!prepared_) return x;

        if (!started_) {
            state_ = highpassInitial(x);
            started_ = true;
        } else {
            state_ = highpassStep(state_, prevX_, x, prevFc_, prevK_, dt_);
        }
        prevX_ = x;
        prevFc_ = fc;
        prevK_ = k;
        return state_.output();
    }

    [[nodiscard]] const FilterState& state() const noexcept { return state_; }
    [[nodiscard]] bool isPrepared() const noexcept { return prepared_; }

private:
    FilterState state_;
    float dt_ = 0.0f;
    float prevX_ = 0.0f;
    float prevFc_ = 0.0f;
    float prevK_ = 0.0f;
    bool prepared_ = false;
    bool started_ = false;
};

} // namespace DSP
} // namespace Patchwork
