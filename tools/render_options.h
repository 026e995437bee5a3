// ==============================================================================
// Patch Render - Command Line Options
// ==============================================================================
// Usage: patch_render [output.csv] [sampleRate] [-v]
// ==============================================================================

#pragma once

#include <patchwork/dsp/core/defaults.h>
#include <patchwork/dsp/core/synth_error.h>

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace Patchwork {
namespace Tools {

struct RenderOptions {
    std::filesystem::path output = "patch.csv";
    double sampleRate = DSP::kDefaultSampleRate;
    bool verbose = false;
};

/// @brief Parse a sample rate, rejecting text with anything after the number
/// @throws DSP::InvalidArgumentError if text is not entirely a number
[[nodiscard]] inline double parseSampleRate(const std::string& text) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error&) {
        throw DSP::InvalidArgumentError("sample rate '" + text + "' is not a number");
    }
    if (consumed != text.size()) {
        throw DSP::InvalidArgumentError("sample rate '" + text + "' has trailing characters");
    }
    return value;
}

/// @brief Parse the arguments after the program name
/// @throws DSP::InvalidArgumentError on too many positionals or a bad sample rate
[[nodiscard]] inline RenderOptions parseRenderOptions(const std::vector<std::string>& args) {
    RenderOptions options;
    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() > 2) {
        throw DSP::InvalidArgumentError("usage: patch_render [output.csv] [sampleRate] [-v]");
    }
    if (!positional.empty()) {
        options.output = positional[0];
    }
    if (positional.size() == 2) {
        options.sampleRate = parseSampleRate(positional[1]);
    }
    return options;
}

} // namespace Tools
} // namespace Patchwork
