// ==============================================================================
// Patch Render
// ==============================================================================
// Renders a fixed demonstration patch to CSV (time,value per line):
//
//   sawtooth 110 Hz -> low-pass (cutoff stepped by sample-and-hold noise)
//   -> high-pass 20 Hz -> VCA driven by an ADSR of a 2 Hz gate -> normalize
//
// Usage: patch_render [output.csv] [sampleRate] [-v]
// ==============================================================================

#include <patchwork/dsp/core/logging.h>
#include <patchwork/dsp/primitives/noise_source.h>
#include <patchwork/dsp/primitives/oscillators.h>
#include <patchwork/dsp/primitives/recursive_filter.h>
#include <patchwork/dsp/primitives/time_base.h>
#include <patchwork/dsp/processors/envelope_generator.h>
#include <patchwork/dsp/processors/signal_utilities.h>

#include "render_options.h"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Patchwork::DSP;

namespace {

// Patch settings
constexpr double kDuration = 2.0;
constexpr float kOscillatorHz = 110.0f;
constexpr float kGateHz = 2.0f;
constexpr double kCutoffHoldHz = 8.0;
constexpr float kCutoffCenterHz = 600.0f;
constexpr float kCutoffSpreadHz = 400.0f;
constexpr float kResonance = 1.5f;
constexpr float kHighpassHz = 20.0f;

Signal renderPatch(double sampleRate) {
    const Signal t = timeVector(0.0, kDuration, sampleRate);
    const size_t n = t.size();

    const Signal oscillator = sawtooth(t, kOscillatorHz);

    // Stepped random cutoff
    const Signal steps = sampleAndHold(t, whiteNoise(n), kCutoffHoldHz);
    const Signal cutoff = amplifier(steps, kCutoffSpreadHz, 1.0f, kCutoffCenterHz);
    const Signal filtered = highpass(lowpass(oscillator, cutoff, kResonance, sampleRate),
                                     kHighpassHz, 0.0f, sampleRate);

    // Gate: first half of every LFO period
    const Signal lfo = square(t, kGateHz);
    const Signal gateSignal = gate(lfo, 0.0f);

    const auto toSamples = [sampleRate](double seconds) {
        return static_cast<size_t>(seconds * sampleRate);
    };
    const AdsrParams adsr{toSamples(0.01), toSamples(0.05), 0.6f, toSamples(0.1)};
    const Signal env = envelope(gateSignal, adsr);

    return normalize(amplifier(filtered, env));
}

void writeCsv(const std::filesystem::path& path, const Signal& t, const Signal& x) {
    std::ofstream f(path);
    if (!f) {
        throw std::runtime_error("failed to create " + path.string());
    }
    for (size_t i = 0; i < x.size(); ++i) {
        f << t[i] << ',' << x[i] << '\n';
    }
    if (!f) {
        throw std::runtime_error("failed to write " + path.string());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const auto options = Patchwork::Tools::parseRenderOptions(
            std::vector<std::string>(argv + 1, argv + argc));
        setLogLevel(options.verbose ? spdlog::level::debug : spdlog::level::info);

        logger()->info("Rendering {} s at {} Hz", kDuration, options.sampleRate);
        const Signal y = renderPatch(options.sampleRate);
        writeCsv(options.output, timeVector(0.0, kDuration, options.sampleRate), y);

        logger()->info("Wrote {} samples to {}", y.size(),
                       std::filesystem::absolute(options.output).string());
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return EXIT_FAILURE;
    }
}
