// ==============================================================================
// Layer 1: DSP Primitive Tests - Recursive Filter
// ==============================================================================
// Tests for: dsp/include/patchwork/dsp/primitives/recursive_filter.h
//
// Covers the initial conditions and single steps against hand-evaluated
// recurrences, steady-state behaviour (DC gain, DC rejection, passband),
// causality, and agreement between the batch and incremental forms.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <patchwork/dsp/primitives/recursive_filter.h>
#include <patchwork/dsp/primitives/noise_source.h>

#include "../../test_helpers/signal_checks.h"

#include <cmath>
#include <vector>

using namespace Patchwork::DSP;
using Catch::Approx;

// ==============================================================================
// Test Constants
// ==============================================================================

constexpr double kTestSampleRate = 8000.0;
constexpr float kTestDt = static_cast<float>(1.0 / kTestSampleRate);

// ==============================================================================
// Step Functions
// ==============================================================================

TEST_CASE("lowpassInitial scales each stage by w/(1+w)", "[recursive_filter][layer1]") {
    const float omega = kTwoPi * 10.0f;
    const float g = omega / (1.0f + omega);
    const auto s = lowpassInitial(2.0f, 10.0f);

    REQUIRE(s.y1 == Approx(g * 2.0f));
    REQUIRE(s.y2 == Approx(g * g * 2.0f));
    REQUIRE(s.y3 == Approx(g * g * g * 2.0f));
    REQUIRE(s.output() == Approx(g * g * g * g * 2.0f));
}

TEST_CASE("lowpassStep reads only the previous state", "[recursive_filter][layer1]") {
    const FilterState s{0.1f, 0.2f, 0.3f, 0.4f};
    const float a = kTestDt * kTwoPi * 500.0f;
    const auto next = lowpassStep(s, 1.0f, 500.0f, 0.5f, kTestDt);

    REQUIRE(next.y1 == Approx(0.1f + a * (1.0f - 0.1f - 0.5f * 0.4f)));
    REQUIRE(next.y2 == Approx(0.2f + a * (0.1f - 0.2f)));
    REQUIRE(next.y3 == Approx(0.3f + a * (0.2f - 0.3f)));
    REQUIRE(next.y4 == Approx(0.4f + a * (0.3f - 0.4f)));
}

TEST_CASE("highpassInitial starts every stage at x0", "[recursive_filter][layer1]") {
    REQUIRE(highpassInitial(0.75f) == FilterState{0.75f, 0.75f, 0.75f, 0.75f});
}

TEST_CASE("highpassStep chains the freshly updated stages", "[recursive_filter][layer1]") {
    const FilterState s{0.1f, 0.2f, 0.3f, 0.4f};
    const float alpha = 1.0f / (kTwoPi * kTestDt * 200.0f + 1.0f);
    const auto next = highpassStep(s, 0.5f, 1.0f, 200.0f, 0.25f, kTestDt);

    const float y1 = alpha * (0.1f + 1.0f - 0.5f - 0.25f * 0.4f);
    const float y2 = alpha * (0.2f + y1 - 0.1f);
    const float y3 = alpha * (0.3f + y2 - 0.2f);
    const float y4 = alpha * (0.4f + y3 - 0.3f);
    REQUIRE(next.y1 == Approx(y1));
    REQUIRE(next.y2 == Approx(y2));
    REQUIRE(next.y3 == Approx(y3));
    REQUIRE(next.y4 == Approx(y4));
}

// ==============================================================================
// Batch Low-Pass
// ==============================================================================

TEST_CASE("lowpass output starts at the initial condition", "[recursive_filter][layer1]") {
    const auto y = lowpass(Signal{1.0f}, 10.0f, 0.0f, kTestSampleRate);
    REQUIRE(y.size() == 1);
    REQUIRE(y[0] == lowpassInitial(1.0f, 10.0f).output());
}

TEST_CASE("lowpass converges to unity DC gain without feedback", "[recursive_filter][layer1]") {
    const Signal x(4000, 1.0f);
    const auto y = lowpass(x, 100.0f, 0.0f, kTestSampleRate);

    REQUIRE(y.size() == x.size());
    REQUIRE(y.back() == Approx(1.0f).margin(1e-3f));
}

TEST_CASE("lowpass feedback lowers the DC gain to 1/(1+k)", "[recursive_filter][layer1]") {
    const Signal x(8000, 1.0f);
    const auto y = lowpass(x, 100.0f, 1.0f, kTestSampleRate);
    REQUIRE(y.back() == Approx(0.5f).margin(1e-3f));
}

TEST_CASE("lowpass attenuates content far above the cutoff", "[recursive_filter][layer1]") {
    // Alternating +-1 sits at Nyquist
    Signal x(2000);
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = (i % 2 == 0) ? 1.0f : -1.0f;
    }
    const auto y = lowpass(x, 50.0f, 0.0f, kTestSampleRate);
    const Signal tail(y.begin() + 1000, y.end());
    REQUIRE(TestUtils::maxAbs(tail) < 1e-3f);
}

TEST_CASE("lowpass is causal", "[recursive_filter][layer1]") {
    const auto x = whiteNoise(256, 3u);
    auto modified = x;
    constexpr size_t kChanged = 100;
    modified[kChanged] += 1.0f;

    const auto y = lowpass(x, 800.0f, 0.3f, kTestSampleRate);
    const auto yModified = lowpass(modified, 800.0f, 0.3f, kTestSampleRate);

    // x[m] enters y1[m+1] and reaches the fourth stage three steps later
    for (size_t i = 0; i < kChanged + 4; ++i) {
        REQUIRE(y[i] == yModified[i]);
    }
    REQUIRE(y[kChanged + 4] != yModified[kChanged + 4]);
}

TEST_CASE("lowpass accepts per-sample cutoff and feedback", "[recursive_filter][layer1]") {
    const Signal x(100, 1.0f);
    const Signal fc(99, 300.0f);
    const Signal k(99, 0.0f);
    REQUIRE(lowpass(x, fc, k, kTestSampleRate) == lowpass(x, 300.0f, 0.0f, kTestSampleRate));
}

TEST_CASE("lowpass rejects short coefficient arrays", "[recursive_filter][layer1][error]") {
    const Signal x(100, 1.0f);
    REQUIRE_THROWS_AS(lowpass(x, Signal(98, 300.0f), 0.0f, kTestSampleRate),
                      IndexOutOfRangeError);
    REQUIRE_THROWS_AS(lowpass(x, 300.0f, Signal(50, 0.0f), kTestSampleRate),
                      IndexOutOfRangeError);

    // A single sample still reads fc[0] for the initial condition
    REQUIRE_THROWS_AS(lowpass(Signal{1.0f}, Signal{}, 0.0f, kTestSampleRate),
                      IndexOutOfRangeError);
}

TEST_CASE("lowpass validates the sample rate and accepts empty input",
          "[recursive_filter][layer1][edge]") {
    REQUIRE_THROWS_AS(lowpass(Signal(10, 1.0f), 100.0f, 0.0f, 0.0), InvalidArgumentError);
    REQUIRE(lowpass(Signal{}, 100.0f, 0.0f, kTestSampleRate).empty());
}

// ==============================================================================
// Batch High-Pass
// ==============================================================================

TEST_CASE("highpass starts at x[0] and rejects DC", "[recursive_filter][layer1]") {
    const Signal x(4000, 1.0f);
    const auto y = highpass(x, 100.0f, 0.0f, kTestSampleRate);

    REQUIRE(y[0] == 1.0f);
    REQUIRE(std::abs(y.back()) < 1e-4f);
}

TEST_CASE("highpass passes content far above the cutoff", "[recursive_filter][layer1]") {
    Signal x(4000);
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = (i % 2 == 0) ? 1.0f : -1.0f;
    }
    const auto y = highpass(x, 10.0f, 0.0f, kTestSampleRate);
    // Steady state per stage is 2 alpha / (1 + alpha), about 0.996 here
    const Signal tail(y.begin() + 3000, y.end());
    REQUIRE(TestUtils::maxAbs(tail) > 0.95f);
    REQUIRE(TestUtils::maxAbs(tail) < 1.0f);
}

TEST_CASE("highpass is causal", "[recursive_filter][layer1]") {
    const auto x = whiteNoise(256, 4u);
    auto modified = x;
    constexpr size_t kChanged = 100;
    modified[kChanged] -= 0.5f;

    const auto y = highpass(x, 200.0f, 0.1f, kTestSampleRate);
    const auto yModified = highpass(modified, 200.0f, 0.1f, kTestSampleRate);

    for (size_t i = 0; i < kChanged; ++i) {
        REQUIRE(y[i] == yModified[i]);
    }
    REQUIRE(y[kChanged] != yModified[kChanged]);
}

TEST_CASE("highpass rejects short coefficient arrays", "[recursive_filter][layer1][error]") {
    const Signal x(100, 1.0f);
    REQUIRE_NOTHROW(highpass(x, Signal(99, 300.0f), Signal(99, 0.0f), kTestSampleRate));
    REQUIRE_THROWS_AS(highpass(x, Signal(98, 300.0f), 0.0f, kTestSampleRate),
                      IndexOutOfRangeError);
    REQUIRE_THROWS_AS(highpass(x, 300.0f, Signal(10, 0.0f), kTestSampleRate),
                      IndexOutOfRangeError);
    REQUIRE_THROWS_AS(highpass(x, 300.0f, 0.0f, -1.0), InvalidArgumentError);
}

// ==============================================================================
// Incremental Cascades
// ==============================================================================

TEST_CASE("LowpassCascade matches the batch low-pass", "[recursive_filter][layer1]") {
    const auto x = whiteNoise(512, 8u);
    Signal fc(x.size());
    for (size_t i = 0; i < fc.size(); ++i) {
        fc[i] = 200.0f + static_cast<float>(i);
    }
    const Signal k(x.size(), 0.7f);

    const auto batch = lowpass(x, fc, k, kTestSampleRate);

    LowpassCascade filter;
    filter.prepare(kTestSampleRate);
    for (size_t i = 0; i < x.size(); ++i) {
        REQUIRE(filter.process(x[i], fc[i], k[i]) == Approx(batch[i]).margin(1e-6f));
    }
}

TEST_CASE("HighpassCascade matches the batch high-pass", "[recursive_filter][layer1]") {
    const auto x = whiteNoise(512, 9u);
    Signal fc(x.size());
    for (size_t i = 0; i < fc.size(); ++i) {
        fc[i] = 1000.0f - static_cast<float>(i);
    }
    const Signal k(x.size(), 0.2f);

    const auto batch = highpass(x, fc, k, kTestSampleRate);

    HighpassCascade filter;
    filter.prepare(kTestSampleRate);
    for (size_t i = 0; i < x.size(); ++i) {
        REQUIRE(filter.process(x[i], fc[i], k[i]) == Approx(batch[i]).margin(1e-6f));
    }
}

TEST_CASE("Cascades restart from the initial condition after reset", "[recursive_filter][layer1]") {
    LowpassCascade filter;
    filter.prepare(kTestSampleRate);
    for (int i = 0; i < 10; ++i) {
        (void)filter.process(1.0f, 100.0f, 0.0f);
    }
    filter.reset();
    REQUIRE(filter.process(1.0f, 100.0f, 0.0f) == lowpassInitial(1.0f, 100.0f).output());
    REQUIRE(filter.state() == lowpassInitial(1.0f, 100.0f));
}

TEST_CASE("Unprepared cascades pass the input through", "[recursive_filter][layer1][edge]") {
    LowpassCascade lp;
    HighpassCascade hp;
    REQUIRE_FALSE(lp.isPrepared());
    REQUIRE(lp.process(0.3f, 100.0f, 0.0f) == 0.3f);
    REQUIRE(hp.process(-0.4f, 100.0f, 0.0f) == -0.4f);
}

TEST_CASE("Cascades reject a non-positive sample rate", "[recursive_filter][layer1][error]") {
    LowpassCascade lp;
    HighpassCascade hp;
    REQUIRE_THROWS_AS(lp.prepare(0.0), InvalidArgumentError);
    REQUIRE_THROWS_AS(hp.prepare(-44100.0), InvalidArgumentError);
    REQUIRE_FALSE(lp.isPrepared());
}
