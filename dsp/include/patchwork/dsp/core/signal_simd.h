// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Element-Wise Math
// ==============================================================================
// Bulk kernels behind the signal utilities, using Google Highway for runtime
// SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// The kernels never validate: callers check lengths and arguments first and
// pass raw pointers with matching counts. Input and output may alias.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Patchwork {
namespace DSP {

/// @brief output[i] = gain * a[i] * b[i] + bias
/// @note SIMD-accelerated with runtime ISA dispatch
void multiplyAddBulk(const float* a, const float* b, float gain, float bias,
                     float* output, std::size_t count) noexcept;

/// @brief output[i] = input[i] >= threshold ? 1 : 0 (NaN maps to 0)
/// @note SIMD-accelerated with runtime ISA dispatch
void thresholdBulk(const float* input, float threshold, float* output,
                   std::size_t count) noexcept;

/// @brief output[i] = input[i] / divisor
/// @note SIMD-accelerated with runtime ISA dispatch
void divideBulk(const float* input, float divisor, float* output,
                std::size_t count) noexcept;

/// @brief Smallest and largest element of input
/// @param minOut Receives the minimum (0 when count == 0)
/// @param maxOut Receives the maximum (0 when count == 0)
/// @note SIMD-accelerated with runtime ISA dispatch
void findMinMaxBulk(const float* input, std::size_t count,
                    float* minOut, float* maxOut) noexcept;

} // namespace DSP
} // namespace Patchwork
