// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seeded Pseudo-Random Number Generation
// ==============================================================================
// Deterministic PRNG for the noise generators, with uniform and Gaussian
// draws.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Patchwork {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Marsaglia xorshift generator (shifts 13, 17, 5), period 2^32-1.
///
/// @note NOT cryptographically secure
///
/// @example
///     Xorshift32 rng(12345);
///     float u = rng.nextFloat();            // [-1.0, 1.0]
///     double g = rng.nextGaussian(0.5);     // Normal(0, 0.5)
class Xorshift32 {
public:
    /// Construct with seed value (0 is replaced with a fixed non-zero seed)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Random uint32_t in [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Random float in [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(static_cast<double>(next()) * kToUnit * 2.0 - 1.0);
    }

    /// @return Random double in (0.0, 1.0]; never 0 because next() never is
    [[nodiscard]] constexpr double nextUnipolar() noexcept {
        return static_cast<double>(next()) * kToUnit;
    }

    /// @brief Normal(0, stdDev) draw using the Box-Muller transform
    ///
    /// Each transform yields two independent values; the second is cached
    /// and returned (scaled) by the following call.
    [[nodiscard]] double nextGaussian(double stdDev = 1.0) noexcept {
        if (hasSpare_) {
            hasSpare_ = false;
            return spare_ * stdDev;
        }
        const double radius = std::sqrt(-2.0 * std::log(nextUnipolar()));
        const double angle = kTwoPiD * nextUnipolar();
        spare_ = radius * std::sin(angle);
        hasSpare_ = true;
        return radius * std::cos(angle) * stdDev;
    }

    /// Reseed the generator and drop any cached Gaussian value
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
        hasSpare_ = false;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept { return state_; }

private:
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1 / (2^32 - 1)
    static constexpr double kToUnit = 1.0 / 4294967295.0;

    uint32_t state_;
    double spare_ = 0.0;
    bool hasSpare_ = false;
};

} // namespace DSP
} // namespace Patchwork
