// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Element-Wise Math
// ==============================================================================
// Highway self-inclusion pattern: foreach_target.h re-includes this file once
// per ISA target. The kernels compile for each target; HWY_EXPORT and
// HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "patchwork/dsp/core/signal_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <algorithm>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Patchwork {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// MultiplyAddImpl: gain * a * b + bias
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MultiplyAddImpl(const float* a, const float* b, float gain, float bias,
                     float* output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto gainV = hn::Set(d, gain);
    const auto biasV = hn::Set(d, bias);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto va = hn::LoadU(d, a + k);
        const auto vb = hn::LoadU(d, b + k);
        hn::StoreU(hn::MulAdd(hn::Mul(gainV, va), vb, biasV), d, output + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        output[k] = gain * a[k] * b[k] + bias;
    }
}

// -----------------------------------------------------------------------------
// ThresholdImpl: 1 where input >= threshold, else 0
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ThresholdImpl(const float* input, float threshold, float* output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto thresholdV = hn::Set(d, threshold);
    const auto one = hn::Set(d, 1.0f);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::LoadU(d, input + k);
        hn::StoreU(hn::IfThenElseZero(hn::Ge(v, thresholdV), one), d, output + k);
    }
    for (; k < count; ++k) {
        output[k] = (input[k] >= threshold) ? 1.0f : 0.0f;
    }
}

// -----------------------------------------------------------------------------
// DivideImpl: input / divisor
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void DivideImpl(const float* input, float divisor, float* output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto divisorV = hn::Set(d, divisor);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        hn::StoreU(hn::Div(hn::LoadU(d, input + k), divisorV), d, output + k);
    }
    for (; k < count; ++k) {
        output[k] = input[k] / divisor;
    }
}

// -----------------------------------------------------------------------------
// FindMinMaxImpl: running lane-wise min/max, reduced once at the end
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void FindMinMaxImpl(const float* HWY_RESTRICT input, size_t count,
                    float* HWY_RESTRICT minOut, float* HWY_RESTRICT maxOut) {
    if (count == 0) {
        *minOut = 0.0f;
        *maxOut = 0.0f;
        return;
    }

    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    float lo = input[0];
    float hi = input[0];

    size_t k = 0;
    if (count >= N) {
        auto vmin = hn::LoadU(d, input);
        auto vmax = vmin;
        for (k = N; k + N <= count; k += N) {
            const auto v = hn::LoadU(d, input + k);
            vmin = hn::Min(vmin, v);
            vmax = hn::Max(vmax, v);
        }
        lo = hn::GetLane(hn::MinOfLanes(d, vmin));
        hi = hn::GetLane(hn::MaxOfLanes(d, vmax));
    }
    for (; k < count; ++k) {
        lo = std::min(lo, input[k]);
        hi = std::max(hi, input[k]);
    }

    *minOut = lo;
    *maxOut = hi;
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Patchwork

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "patchwork/dsp/core/signal_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Patchwork {
namespace DSP {

HWY_EXPORT(MultiplyAddImpl);
HWY_EXPORT(ThresholdImpl);
HWY_EXPORT(DivideImpl);
HWY_EXPORT(FindMinMaxImpl);

void multiplyAddBulk(const float* a, const float* b, float gain, float bias,
                     float* output, std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(MultiplyAddImpl)(a, b, gain, bias, output, count);
}

void thresholdBulk(const float* input, float threshold, float* output,
                   std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(ThresholdImpl)(input, threshold, output, count);
}

void divideBulk(const float* input, float divisor, float* output,
                std::size_t count) noexcept {
    HWY_DYNAMIC_DISPATCH(DivideImpl)(input, divisor, output, count);
}

void findMinMaxBulk(const float* input, std::size_t count,
                    float* minOut, float* maxOut) noexcept {
    HWY_DYNAMIC_DISPATCH(FindMinMaxImpl)(input, count, minOut, maxOut);
}

}  // namespace DSP
}  // namespace Patchwork

#endif  // HWY_ONCE
