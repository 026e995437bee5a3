// ==============================================================================
// Tool Tests - Patch Render Options
// ==============================================================================
// Tests for: tools/render_options.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "render_options.h"

#include <string>
#include <vector>

using namespace Patchwork::Tools;
using Patchwork::DSP::InvalidArgumentError;

TEST_CASE("parseRenderOptions uses defaults without arguments", "[render_options][tools]") {
    const auto options = parseRenderOptions({});
    REQUIRE(options.output == "patch.csv");
    REQUIRE(options.sampleRate == Patchwork::DSP::kDefaultSampleRate);
    REQUIRE_FALSE(options.verbose);
}

TEST_CASE("parseRenderOptions reads output, sample rate and verbosity", "[render_options][tools]") {
    const auto options = parseRenderOptions({"out.csv", "-v", "8000"});
    REQUIRE(options.output == "out.csv");
    REQUIRE(options.sampleRate == 8000.0);
    REQUIRE(options.verbose);
}

TEST_CASE("parseSampleRate rejects trailing characters", "[render_options][tools][error]") {
    REQUIRE(parseSampleRate("44100") == 44100.0);
    REQUIRE(parseSampleRate("22050.5") == 22050.5);

    REQUIRE_THROWS_AS(parseSampleRate("8000abc"), InvalidArgumentError);
    REQUIRE_THROWS_AS(parseSampleRate("8000 "), InvalidArgumentError);
    REQUIRE_THROWS_AS(parseSampleRate("abc"), InvalidArgumentError);
    REQUIRE_THROWS_AS(parseSampleRate(""), InvalidArgumentError);
    REQUIRE_THROWS_AS(parseRenderOptions({"out.csv", "8000abc"}), InvalidArgumentError);
}

TEST_CASE("parseRenderOptions rejects extra positionals", "[render_options][tools][error]") {
    REQUIRE_THROWS_AS(parseRenderOptions({"a.csv", "8000", "extra"}), InvalidArgumentError);
}
