// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Mathematical constants shared by the generators and filters.
//
// Float constants feed per-sample coefficients; the double variants feed
// oscillator phase.
// ==============================================================================

#pragma once

namespace Patchwork {
namespace DSP {

/// Pi for per-sample coefficient math
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi: omega = kTwoPi * fc
inline constexpr float kTwoPi = 2.0f * kPi;

/// Pi in double precision (phase accumulation)
inline constexpr double kPiD = 3.14159265358979323846;

/// Two times Pi in double precision
inline constexpr double kTwoPiD = 2.0 * kPiD;

} // namespace DSP
} // namespace Patchwork
