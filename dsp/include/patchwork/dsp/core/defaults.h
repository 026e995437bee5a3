// ==============================================================================
// Layer 0: Core Utility - Default Settings
// ==============================================================================
// Compile-time defaults shared by the generators, utilities and tools.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Patchwork {
namespace DSP {

/// Sample rate used by the tools when none is given (Hz)
inline constexpr double kDefaultSampleRate = 8000.0;

/// Threshold separating gate-low from gate-high in gate()
inline constexpr float kDefaultGateThreshold = 0.5f;

/// Duty cycle of the canonical square wave
inline constexpr float kDefaultDutyCycle = 0.5f;

/// Sawtooth width giving a falling ramp
inline constexpr float kDefaultSawtoothWidth = 0.0f;

/// Seed used by the noise generators when the caller supplies none
inline constexpr uint32_t kDefaultNoiseSeed = 12345u;

} // namespace DSP
} // namespace Patchwork
