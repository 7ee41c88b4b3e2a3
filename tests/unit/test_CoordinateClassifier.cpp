// =============================================================================
// Unit tests for CoordinateClassifier
// Pure logic, no platform dependencies.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "cursorzoom/display/CoordinateClassifier.h"

using namespace CursorZoom;
using Catch::Approx;

static ClassifierInput makeInput(SizeF reported, std::optional<SizeF> pixels,
                                 std::optional<float> hint = std::nullopt)
{
    ClassifierInput in;
    in.reportedSize = reported;
    in.pixelSize = pixels;
    in.backingScaleHint = hint;
    return in;
}

TEST_CASE("Retina display reported in points is classified by its backing hint", "[CoordinateClassifier]")
{
    auto c = CoordinateClassifier::classify(makeInput({2560, 1440}, SizeF{5120, 2880}, 2.0f));

    REQUIRE(c.units == SizeUnits::Points);
    REQUIRE(c.basis == ScaleBasis::BackingHint);
    REQUIRE(c.scaleX == Approx(2.0f));
    REQUIRE(c.scaleY == Approx(2.0f));
    REQUIRE_FALSE(c.ambiguous);
}

TEST_CASE("Reported size equal to capture size is pixels", "[CoordinateClassifier]")
{
    SECTION("no hint")
    {
        auto c = CoordinateClassifier::classify(makeInput({1920, 1080}, SizeF{1920, 1080}));
        REQUIRE(c.units == SizeUnits::Pixels);
        REQUIRE(c.basis == ScaleBasis::UnitRatio);
        REQUIRE(c.scaleX == Approx(1.0f));
    }

    SECTION("hint says the pixels stand for a scaled desktop")
    {
        auto c = CoordinateClassifier::classify(makeInput({2880, 1800}, SizeF{2880, 1800}, 2.0f));
        REQUIRE(c.units == SizeUnits::Pixels);
        REQUIRE(c.basis == ScaleBasis::UnitRatio);
        REQUIRE(c.scaleX == Approx(2.0f));
        REQUIRE(c.scaleY == Approx(2.0f));
    }

    SECTION("small encoder rounding is tolerated")
    {
        auto c = CoordinateClassifier::classify(makeInput({1920, 1080}, SizeF{1920, 1088}));
        REQUIRE(c.units == SizeUnits::Pixels);
    }
}

TEST_CASE("Classifier recovers exact scales", "[CoordinateClassifier]")
{
    const SizeF logicals[] = {{1920, 1080}, {1280, 800}, {1366, 768}, {3440, 1440}};
    const float scales[] = {0.5f, 1.0f, 1.5f, 2.0f, 2.5f, 3.0f, 4.0f};

    for (const SizeF& logical : logicals)
    {
        for (float s : scales)
        {
            const SizeF pixels{logical.width * s, logical.height * s};
            INFO("logical " << logical.width << "x" << logical.height << " scale " << s);

            auto noHint = CoordinateClassifier::classify(makeInput(logical, pixels));
            REQUIRE(noHint.scaleX == Approx(s));
            REQUIRE(noHint.scaleY == Approx(s));

            auto hinted = CoordinateClassifier::classify(makeInput(logical, pixels, s));
            REQUIRE(hinted.scaleX == Approx(s));
            REQUIRE(hinted.scaleY == Approx(s));
        }
    }
}

TEST_CASE("Fractional hint is trusted when it explains the ratio", "[CoordinateClassifier]")
{
    auto c = CoordinateClassifier::classify(makeInput({1536, 864}, SizeF{1920, 1080}, 1.25f));
    REQUIRE(c.basis == ScaleBasis::BackingHint);
    REQUIRE(c.scaleX == Approx(1.25f));
}

TEST_CASE("Derived scale rounds to the nearest half", "[CoordinateClassifier]")
{
    // Ratio 2.0 but a stale hint of 1.0
    auto c = CoordinateClassifier::classify(makeInput({1440, 900}, SizeF{2880, 1800}, 1.0f));
    REQUIRE(c.basis == ScaleBasis::Derived);
    REQUIRE(c.units == SizeUnits::Points);
    REQUIRE(c.scaleX == Approx(2.0f));
    REQUIRE_FALSE(c.ambiguous);

    // Ratio 1.3 rounds to 1.5 but does not reproduce the capture size
    auto fuzzy = CoordinateClassifier::classify(makeInput({1000, 1000}, SizeF{1300, 1300}));
    REQUIRE(fuzzy.basis == ScaleBasis::Derived);
    REQUIRE(fuzzy.scaleX == Approx(1.5f));
    REQUIRE(fuzzy.ambiguous);
}

TEST_CASE("Implausible ratios fall back to scale 1 and are flagged", "[CoordinateClassifier]")
{
    auto c = CoordinateClassifier::classify(makeInput({320, 200}, SizeF{3840, 2400}));
    REQUIRE(c.scaleX == Approx(1.0f));
    REQUIRE(c.scaleY == Approx(1.0f));
    REQUIRE(c.ambiguous);
}

TEST_CASE("Without capture size the hint or scale 1 is used", "[CoordinateClassifier]")
{
    auto none = CoordinateClassifier::classify(makeInput({1920, 1080}, std::nullopt));
    REQUIRE(none.units == SizeUnits::Points);
    REQUIRE(none.basis == ScaleBasis::Default);
    REQUIRE(none.scaleX == Approx(1.0f));

    auto hinted = CoordinateClassifier::classify(makeInput({1440, 900}, std::nullopt, 2.0f));
    REQUIRE(hinted.units == SizeUnits::Points);
    REQUIRE(hinted.basis == ScaleBasis::BackingHint);
    REQUIRE(hinted.scaleX == Approx(2.0f));

    // Non-positive hints are ignored
    auto bogus = CoordinateClassifier::classify(makeInput({1440, 900}, std::nullopt, 0.0f));
    REQUIRE(bogus.basis == ScaleBasis::Default);
    REQUIRE(bogus.scaleX == Approx(1.0f));
}

TEST_CASE("Manual override bypasses detection", "[CoordinateClassifier]")
{
    auto in = makeInput({2560, 1440}, SizeF{5120, 2880}, 2.0f);
    in.manualScale = ScaleOverride{1.5f, 1.75f};

    auto c = CoordinateClassifier::classify(in);
    REQUIRE(c.basis == ScaleBasis::Manual);
    REQUIRE(c.units == SizeUnits::Points);
    REQUIRE(c.scaleX == Approx(1.5f));
    REQUIRE(c.scaleY == Approx(1.75f));

    // A zero override is not an override
    in.manualScale = ScaleOverride{0.0f, 0.0f};
    REQUIRE(CoordinateClassifier::classify(in).basis == ScaleBasis::BackingHint);
}

TEST_CASE("Display labels yield size and origin", "[CoordinateClassifier]")
{
    auto g = CoordinateClassifier::parseReportedGeometry("Monitor: 1920x1080 @ 0,0");
    REQUIRE(g.has_value());
    REQUIRE(g->size.width == Approx(1920.0f));
    REQUIRE(g->size.height == Approx(1080.0f));
    REQUIRE(g->hasOrigin);
    REQUIRE(g->origin.x == Approx(0.0f));

    auto left = CoordinateClassifier::parseReportedGeometry("DELL U2720Q: 2560 x 1440 @ -2560, -200");
    REQUIRE(left.has_value());
    REQUIRE(left->size.width == Approx(2560.0f));
    REQUIRE(left->origin.x == Approx(-2560.0f));
    REQUIRE(left->origin.y == Approx(-200.0f));

    auto sizeOnly = CoordinateClassifier::parseReportedGeometry("Built-in 1440x900");
    REQUIRE(sizeOnly.has_value());
    REQUIRE_FALSE(sizeOnly->hasOrigin);

    REQUIRE_FALSE(CoordinateClassifier::parseReportedGeometry("Display 1").has_value());
    REQUIRE_FALSE(CoordinateClassifier::parseReportedGeometry("0x1080 @ 0,0").has_value());
}
