// ==============================================================================
// Layer 2: DSP Processor - Envelope Generator
// ==============================================================================
// Builds an ADSR gain trajectory from a binary gate signal.
//
// The gate is split into maximal runs of equal value. A gate-high run starts
// with the attack+decay shape and holds the sustain level afterwards; a
// gate-low run starts with the release shape and holds 0 afterwards. A
// leading gate-low run is silent: nothing can be released before the first
// attack.
//
// Segment shapes (t counts samples from the start of the segment):
//   attack   t / A                 t = 0..A-1
//   decay    1 - t * S / D         t = 0..D-1   (heads toward 1 - S, not S)
//   sustain  S
//   release  S - t * S / R         t = 0..R-1
//
// The release always starts from S, whatever level the previous run reached.
// Values are not clamped.
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/logging.h>
#include <patchwork/dsp/core/parameter.h>
#include <patchwork/dsp/core/synth_error.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace Patchwork {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

/// @brief ADSR settings; segment lengths are in samples
struct AdsrParams {
    size_t attack = 0;     ///< Attack length A
    size_t decay = 0;      ///< Decay length D
    float sustain = 1.0f;  ///< Sustain level S in [0, 1]
    size_t release = 0;    ///< Release length R
};

/// @brief Pre-computed segment shapes for one AdsrParams
struct AdsrSegments {
    Signal attackDecay;  ///< Attack followed by decay (A + D samples)
    Signal release;      ///< R samples
    float sustain = 1.0f;
};

/// @brief One maximal run of equal gate values
struct GateRun {
    size_t start = 0;
    size_t length = 0;
    bool high = false;
};

// =============================================================================
// Building Blocks
// =============================================================================

/// @brief Evaluate the attack, decay and release shapes
/// @throws InvalidArgumentError if sustain is outside [0, 1]
[[nodiscard]] inline AdsrSegments makeSegments(const AdsrParams& params) {
    detail::requireInRange(params.sustain, 0.0f, 1.0f, "sustain", 0);

    const float s = params.sustain;
    AdsrSegments segments;
    segments.sustain = s;

    segments.attackDecay.reserve(params.attack + params.decay);
    const auto a = static_cast<float>(params.attack);
    for (size_t t = 0; t < params.attack; ++t) {
        segments.attackDecay.push_back(static_cast<float>(t) / a);
    }
    const auto d = static_cast<float>(params.decay);
    for (size_t t = 0; t < params.decay; ++t) {
        segments.attackDecay.push_back(1.0f - static_cast<float>(t) * s / d);
    }

    segments.release.reserve(params.release);
    const auto r = static_cast<float>(params.release);
    for (size_t t = 0; t < params.release; ++t) {
        segments.release.push_back(s - static_cast<float>(t) * s / r);
    }
    return segments;
}

/// @brief Split a gate signal into maximal constant runs
/// @throws InvalidArgumentError if a sample is neither 0 nor 1
[[nodiscard]] inline std::vector<GateRun> splitRuns(const Signal& gateSignal) {
    std::vector<GateRun> runs;
    for (size_t i = 0; i < gateSignal.size(); ++i) {
        const float g = gateSignal[i];
        if (g != 0.0f && g != 1.0f) {
            throw InvalidArgumentError("gate[" + std::to_string(i) + "] = " + std::to_string(g)
                                       + " is not 0 or 1");
        }
        const bool high = (g == 1.0f);
        if (runs.empty() || runs.back().high != high) {
            runs.push_back(GateRun{i, 0, high});
        }
        ++runs.back().length;
    }
    return runs;
}

namespace detail {

/// Write prefix (truncated to the run) followed by fill up to the run end
inline void fillRun(Signal& out, const GateRun& run, const Signal& prefix, float fill) {
    const size_t prefixLength = std::min(prefix.size(), run.length);
    if (prefixLength < prefix.size()) {
        logger()->debug("envelope: {} run at {} holds {} of {} {} samples",
                        run.high ? "gate-high" : "gate-low", run.start, run.length,
                        prefix.size(), run.high ? "attack+decay" : "release");
    }
    auto first = out.begin() + static_cast<std::ptrdiff_t>(run.start);
    std::copy_n(prefix.begin(), prefixLength, first);
    std::fill(first + static_cast<std::ptrdiff_t>(prefixLength),
              first + static_cast<std::ptrdiff_t>(run.length), fill);
}

} // namespace detail

// =============================================================================
// Envelope
// =============================================================================

/// @brief ADSR envelope for a gate signal
///
/// @param gateSignal Samples valued exactly 0 or 1
/// @param params Segment lengths (samples) and sustain level
/// @return Envelope with gateSignal.size() samples
/// @throws InvalidArgumentError on a non-binary gate or sustain outside [0, 1]
///
/// @par Example
/// gate = [1]*10, A=3, D=2, S=0.5, R=2 gives
/// [0, 1/3, 2/3, 1, 0.75, 0.5, 0.5, 0.5, 0.5, 0.5]
[[nodiscard]] inline Signal envelope(const Signal& gateSignal, const AdsrParams& params) {
    const AdsrSegments segments = makeSegments(params);
    const std::vector<GateRun> runs = splitRuns(gateSignal);

    logger()->debug("envelope: {} samples in {} runs (A={} D={} S={} R={})",
                    gateSignal.size(), runs.size(), params.attack, params.decay,
                    params.sustain, params.release);

    Signal out(gateSignal.size(), 0.0f);
    for (size_t r = 0; r < runs.size(); ++r) {
        const GateRun& run = runs[r];
        if (run.high) {
            detail::fillRun(out, run, segments.attackDecay, segments.sustain);
        } else if (r > 0) {
            detail::fillRun(out, run, segments.release, 0.0f);
        }
        // A leading gate-low run stays at 0
    }
    return out;
}

/// @brief ADSR envelope from individual settings
[[nodiscard]] inline Signal envelope(const Signal& gateSignal, size_t attack, size_t decay,
                                     float sustain, size_t release) {
    return envelope(gateSignal, AdsrParams{attack, decay, sustain, release});
}

} // namespace DSP
} // namespace Patchwork
