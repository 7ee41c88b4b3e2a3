// =============================================================================
// Unit tests for ZoomController
// Pure logic, no platform dependencies.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "cursorzoom/logic/ZoomController.h"

#include <cmath>
#include <memory>
#include <string>
#include <utility>

using namespace CursorZoom;
using Catch::Approx;

static MappedPoint at(float x, float y)
{
    MappedPoint m;
    m.px = x;
    m.py = y;
    m.valid = true;
    return m;
}

static std::shared_ptr<const ZoomProfile> makeProfile(float factor, float zoomSpeed,
                                                      float followSpeed, float border,
                                                      Easing::Kind easing = Easing::Kind::Linear,
                                                      bool autoFollow = true)
{
    auto p = std::make_shared<ZoomProfile>();
    p->name = "test";
    p->zoomFactor = factor;
    p->zoomSpeed = zoomSpeed;
    p->followSpeed = followSpeed;
    p->followBorder = border;
    p->followSafezoneSensitivity = 0.0f;
    p->easing = easing;
    p->autoFollow = autoFollow;
    return p;
}

static MappedPoint outside(float x, float y)
{
    MappedPoint m = at(x, y);
    m.clamped = true;
    return m;
}

static float distance(PointF a, PointF b)
{
    return std::hypot(a.x - b.x, a.y - b.y);
}

// Zooms in on `target` and runs the animation to completion.
static void zoomInFully(ZoomController& zc, MappedPoint target)
{
    zc.toggleZoom(target);
    for (int i = 0; i < 1000 && zc.mode() == ZoomController::Mode::ZoomingIn; ++i)
        zc.advance(0.05f, target);
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
}

TEST_CASE("ZoomController starts idle on the full frame", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});

    REQUIRE(zc.mode() == ZoomController::Mode::Idle);
    REQUIRE_FALSE(zc.isZoomed());
    REQUIRE_FALSE(zc.followEnabled());
    REQUIRE(zc.cropRect() == CropRect{0, 0, 1920, 1080});
    REQUIRE(zc.effectiveZoom() == Approx(1.0f));

    // Idle ticks keep the full frame
    REQUIRE(zc.advance(0.016f, at(100, 100)) == CropRect{0, 0, 1920, 1080});
}

TEST_CASE("Extent is halfway after half the zoom duration", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    REQUIRE(zc.setProfile(makeProfile(2.0f, 1.0f, 1.0f, 0.0f)));

    zc.toggleZoom(at(960, 540));
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingIn);

    zc.advance(0.5f, at(960, 540));
    REQUIRE(zc.currentExtent().width == Approx(1440.0f));
    REQUIRE(zc.currentExtent().height == Approx(810.0f));
    REQUIRE(zc.zoomProgress() == Approx(0.5f));
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingIn);

    zc.advance(0.5f, at(960, 540));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
    REQUIRE(zc.currentExtent().width == Approx(960.0f));
    REQUIRE(zc.currentExtent().height == Approx(540.0f));
    REQUIRE(zc.effectiveZoom() == Approx(2.0f));
}

TEST_CASE("Completing a zoom-in switches following on when auto-follow is set", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});

    SECTION("auto-follow")
    {
        zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f, Easing::Kind::Linear, true));
        zoomInFully(zc, at(600, 400));
        REQUIRE(zc.followEnabled());
    }

    SECTION("manual follow")
    {
        zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f, Easing::Kind::Linear, false));
        zoomInFully(zc, at(600, 400));
        REQUIRE_FALSE(zc.followEnabled());
    }

    REQUIRE(zc.currentCenter().x == Approx(600.0f));
    REQUIRE(zc.currentCenter().y == Approx(400.0f));
}

TEST_CASE("advance(0) never moves the rectangle", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 2.0f, 2.0f, 0.0f, Easing::Kind::EaseInOut));

    auto check = [&zc]() {
        const PointF c = zc.currentCenter();
        const SizeF e = zc.currentExtent();
        const CropRect r = zc.cropRect();
        for (int i = 0; i < 5; ++i)
        {
            zc.advance(0.0f, at(1700.0f - i * 100.0f, 900.0f));
            REQUIRE(zc.currentCenter().x == c.x);
            REQUIRE(zc.currentCenter().y == c.y);
            REQUIRE(zc.currentExtent().width == e.width);
            REQUIRE(zc.currentExtent().height == e.height);
            REQUIRE(zc.cropRect() == r);
        }
    };

    check();                        // Idle
    zc.toggleZoom(at(400, 300));
    zc.advance(0.1f, at(400, 300));
    check();                        // ZoomingIn
    for (int i = 0; i < 100 && zc.mode() == ZoomController::Mode::ZoomingIn; ++i)
        zc.advance(0.1f, at(400, 300));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
    check();                        // Zoomed, following
    zc.toggleZoom(at(400, 300));
    zc.advance(0.1f, at(400, 300));
    check();                        // ZoomingOut
}

TEST_CASE("Monotone easings approach the target every tick", "[ZoomController]")
{
    const Easing::Kind kinds[] = {
        Easing::Kind::Linear,      Easing::Kind::EaseIn,       Easing::Kind::EaseOut,
        Easing::Kind::EaseInOut,   Easing::Kind::EaseInCubic,  Easing::Kind::EaseOutCubic,
        Easing::Kind::EaseInSine,  Easing::Kind::EaseOutSine,  Easing::Kind::EaseInOutSine,
        Easing::Kind::EaseOutExpo,
    };

    for (auto kind : kinds)
    {
        INFO(Easing::name(kind));
        REQUIRE(Easing::isMonotonic(kind));

        ZoomController zc;
        zc.setSourceSize({1920, 1080});
        zc.setProfile(makeProfile(2.0f, 1.0f, 1.0f, 0.0f, kind));

        const MappedPoint target = at(400, 300);
        zc.toggleZoom(target);

        float prevWidth = zc.currentExtent().width;
        float prevDist = distance(zc.currentCenter(), target.point());
        int steps = 0;
        while (zc.mode() == ZoomController::Mode::ZoomingIn && steps < 100)
        {
            zc.advance(0.0625f, target);
            ++steps;
            const float width = zc.currentExtent().width;
            const float dist = distance(zc.currentCenter(), target.point());
            REQUIRE(width < prevWidth);
            REQUIRE(dist < prevDist);
            prevWidth = width;
            prevDist = dist;
        }
        REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
        REQUIRE(zc.currentExtent().width == Approx(960.0f));
    }
}

TEST_CASE("Mouse override replaces the live cursor until cleared", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));

    SECTION("while zooming in")
    {
        zc.toggleZoom(at(960, 540));
        zc.setMouseOverride({100, 200});
        zc.advance(0.05f, at(1500, 900));
        REQUIRE(zc.targetCenter().x == Approx(100.0f));
        REQUIRE(zc.targetCenter().y == Approx(200.0f));
    }

    SECTION("while zoomed and following")
    {
        zoomInFully(zc, at(960, 540));
        REQUIRE(zc.followEnabled());

        zc.setMouseOverride({100, 200});
        for (int i = 0; i < 10; ++i)
        {
            zc.advance(0.05f, at(1500.0f - i * 10.0f, 900.0f));
            REQUIRE(zc.targetCenter().x == Approx(100.0f));
            REQUIRE(zc.targetCenter().y == Approx(200.0f));
        }

        zc.clearMouseOverride();
        REQUIRE_FALSE(zc.mouseOverride().has_value());
        zc.advance(0.05f, at(1500, 900));
        REQUIRE(zc.targetCenter().x == Approx(1500.0f));
        REQUIRE(zc.targetCenter().y == Approx(900.0f));
    }

    SECTION("toggle zoom aims at the override")
    {
        zc.setMouseOverride({100, 200});
        zc.toggleZoom(at(1500, 900));
        REQUIRE(zc.targetCenter().x == Approx(100.0f));
        REQUIRE(zc.targetCenter().y == Approx(200.0f));
    }
}

TEST_CASE("Follow border holds the centre until the cursor leaves it", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({2000, 2000});
    zc.setProfile(makeProfile(2.0f, 10.0f, 2.0f, 8.0f));

    zc.toggleZoom(at(500, 500));
    zc.advance(0.2f, at(500, 500));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
    REQUIRE(zc.followEnabled());
    REQUIRE(zc.currentCenter().x == Approx(500.0f));

    zc.advance(0.016f, at(505, 505));
    REQUIRE(zc.currentCenter().x == 500.0f);
    REQUIRE(zc.currentCenter().y == 500.0f);
    REQUIRE_FALSE(zc.isTrackingCenter());

    zc.advance(0.016f, at(520, 520));
    REQUIRE(zc.isTrackingCenter());
    REQUIRE(zc.currentCenter().x > 500.0f);
    REQUIRE(zc.currentCenter().x < 520.0f);
    REQUIRE(zc.currentCenter().y > 500.0f);

    // The leg finishes on the cursor
    for (int i = 0; i < 100 && zc.isTrackingCenter(); ++i)
        zc.advance(0.016f, at(520, 520));
    REQUIRE(zc.currentCenter().x == Approx(520.0f));
    REQUIRE(zc.currentCenter().y == Approx(520.0f));
}

TEST_CASE("Follow off freezes the centre", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));
    zoomInFully(zc, at(800, 500));

    zc.toggleFollow();
    REQUIRE_FALSE(zc.followEnabled());
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);

    const PointF frozen = zc.currentCenter();
    for (int i = 0; i < 20; ++i)
        zc.advance(0.05f, at(1800, 1000));
    REQUIRE(zc.currentCenter().x == frozen.x);
    REQUIRE(zc.currentCenter().y == frozen.y);

    zc.toggleFollow();
    for (int i = 0; i < 40; ++i)
        zc.advance(0.05f, at(1200, 700));
    REQUIRE(zc.currentCenter().x == Approx(1200.0f));
}

TEST_CASE("Safezone sensitivity locks a centre leg short of the cursor", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({2000, 2000});
    auto p = std::make_shared<ZoomProfile>(*makeProfile(2.0f, 10.0f, 1.0f, 8.0f));
    p->followSafezoneSensitivity = 4.0f;
    zc.setProfile(p);

    zc.toggleZoom(at(500, 500));
    zc.advance(0.2f, at(500, 500));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);

    // One pixel per tick toward (600, 600)
    zc.advance(0.01f, at(600, 600));
    REQUIRE(zc.isTrackingCenter());

    int ticks = 0;
    while (zc.isTrackingCenter() && ticks < 200)
    {
        zc.advance(0.01f, at(600, 600));
        ++ticks;
    }
    REQUIRE_FALSE(zc.isTrackingCenter());
    REQUIRE(zc.currentCenter().x > 595.0f);
    REQUIRE(zc.currentCenter().x < 598.0f);
    REQUIRE(zc.currentCenter().y > 595.0f);
    REQUIRE(zc.currentCenter().y < 598.0f);

    // Locked: the follow border now holds it
    const PointF locked = zc.currentCenter();
    zc.advance(0.01f, at(600, 600));
    REQUIRE(zc.currentCenter().x == locked.x);
    REQUIRE(zc.currentCenter().y == locked.y);
}

TEST_CASE("Safezone sensitivity does not cut an override leg short", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({2000, 2000});
    auto p = std::make_shared<ZoomProfile>(*makeProfile(2.0f, 10.0f, 2.0f, 8.0f));
    p->followSafezoneSensitivity = 50.0f;
    zc.setProfile(p);
    zc.toggleZoom(at(500, 500));
    zc.advance(0.2f, at(500, 500));

    zc.setMouseOverride({900, 900});
    for (int i = 0; i < 30; ++i)
        zc.advance(0.05f, at(500, 500));
    REQUIRE(zc.currentCenter().x == Approx(900.0f));
    REQUIRE(zc.currentCenter().y == Approx(900.0f));
}

TEST_CASE("Auto-lock on reverse stops the centre when the cursor turns back", "[ZoomController]")
{
    auto run = [](bool autoLock) {
        ZoomController zc;
        zc.setSourceSize({2000, 2000});
        auto p = std::make_shared<ZoomProfile>(*makeProfile(2.0f, 10.0f, 1.0f, 8.0f));
        p->autoLockOnReverse = autoLock;
        zc.setProfile(p);
        zc.toggleZoom(at(500, 500));
        zc.advance(0.2f, at(500, 500));

        zc.advance(0.1f, at(800, 500));      // leg starts heading right
        zc.advance(0.1f, at(820, 500));      // still heading right
        REQUIRE(zc.isTrackingCenter());
        const float before = zc.currentCenter().x;

        zc.advance(0.1f, at(700, 500));      // cursor turns back
        return std::make_pair(before, zc);
    };

    SECTION("enabled")
    {
        auto result = run(true);
        const ZoomController& zc = result.second;
        REQUIRE_FALSE(zc.isTrackingCenter());
        REQUIRE(zc.currentCenter().x == result.first);
    }

    SECTION("disabled")
    {
        auto result = run(false);
        const ZoomController& zc = result.second;
        REQUIRE(zc.isTrackingCenter());
        REQUIRE(zc.currentCenter().x != result.first);
    }
}

TEST_CASE("Following pauses while the cursor is off the source", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});

    SECTION("default profile holds still")
    {
        zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));
        zoomInFully(zc, at(800, 500));
        const PointF held = zc.currentCenter();

        for (int i = 0; i < 20; ++i)
            zc.advance(0.05f, outside(1919, 500));
        REQUIRE(zc.currentCenter().x == held.x);
        REQUIRE(zc.currentCenter().y == held.y);

        // Back on the source: following resumes
        for (int i = 0; i < 20; ++i)
            zc.advance(0.05f, at(1200, 600));
        REQUIRE(zc.currentCenter().x == Approx(1200.0f));
    }

    SECTION("followOutsideBounds keeps following to the edge")
    {
        auto p = std::make_shared<ZoomProfile>(*makeProfile(2.0f, 4.0f, 4.0f, 0.0f));
        p->followOutsideBounds = true;
        zc.setProfile(p);
        zoomInFully(zc, at(800, 500));

        for (int i = 0; i < 20; ++i)
            zc.advance(0.05f, outside(1919, 500));
        REQUIRE(zc.currentCenter().x == Approx(1919.0f));
    }
}

TEST_CASE("Zoom out returns to idle and the full frame", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 2.0f, 2.0f, 0.0f, Easing::Kind::EaseOut));
    zoomInFully(zc, at(300, 200));

    zc.toggleZoom(at(300, 200));
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingOut);
    REQUIRE(zc.isAnimating());

    zc.advance(0.25f, at(300, 200));
    REQUIRE(zc.currentExtent().width > 960.0f);
    REQUIRE(zc.currentExtent().width < 1920.0f);

    zc.advance(0.25f, at(300, 200));
    REQUIRE(zc.mode() == ZoomController::Mode::Idle);
    REQUIRE(zc.cropRect() == CropRect{0, 0, 1920, 1080});
}

TEST_CASE("Zooming out switches following off", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f, Easing::Kind::Linear, false));
    zoomInFully(zc, at(960, 540));

    zc.toggleFollow();
    REQUIRE(zc.followEnabled());

    zc.toggleZoom(at(960, 540));
    REQUIRE_FALSE(zc.followEnabled());
    for (int i = 0; i < 20 && zc.mode() != ZoomController::Mode::Idle; ++i)
        zc.advance(0.05f, at(960, 540));
    REQUIRE(zc.mode() == ZoomController::Mode::Idle);

    // Without auto-follow the next zoom-in stays put
    zoomInFully(zc, at(960, 540));
    REQUIRE_FALSE(zc.followEnabled());
    const PointF c = zc.currentCenter();
    for (int i = 0; i < 10; ++i)
        zc.advance(0.05f, at(200, 200));
    REQUIRE(zc.currentCenter().x == c.x);
}

TEST_CASE("Toggling during zoom-out zooms back in without a jump", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 2.0f, 2.0f, 0.0f));
    zoomInFully(zc, at(960, 540));

    zc.toggleZoom(at(960, 540));
    zc.advance(0.2f, at(960, 540));
    const SizeF partial = zc.currentExtent();
    const CropRect before = zc.cropRect();

    zc.toggleZoom(at(960, 540));
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingIn);
    REQUIRE(zc.currentExtent().width == partial.width);
    REQUIRE(zc.cropRect() == before);

    zc.advance(0.05f, at(960, 540));
    REQUIRE(zc.currentExtent().width < partial.width);
}

TEST_CASE("Toggling during zoom-in starts zooming out", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 1.0f, 1.0f, 0.0f));

    zc.toggleZoom(at(960, 540));
    zc.advance(0.5f, at(960, 540));
    zc.toggleZoom(at(960, 540));
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingOut);
    REQUIRE(zc.currentExtent().width == Approx(1440.0f));
}

TEST_CASE("Profile swap keeps mode and rectangle", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));
    zoomInFully(zc, at(960, 540));

    const CropRect before = zc.cropRect();
    REQUIRE(zc.setProfile(makeProfile(2.0f, 8.0f, 8.0f, 20.0f, Easing::Kind::EaseOut)));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
    REQUIRE(zc.cropRect() == before);

    // A different factor eases to the new extent from where it is
    REQUIRE(zc.setProfile(makeProfile(3.0f, 4.0f, 4.0f, 0.0f)));
    REQUIRE(zc.cropRect() == before);
    for (int i = 0; i < 20; ++i)
        zc.advance(0.05f, at(960, 540));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
    REQUIRE(zc.currentExtent().width == Approx(640.0f));
    REQUIRE(zc.currentExtent().height == Approx(360.0f));
}

TEST_CASE("Invalid profiles are rejected", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    const std::string original = zc.profile().name;

    REQUIRE_FALSE(zc.setProfile(nullptr));
    REQUIRE_FALSE(zc.setProfile(makeProfile(2.0f, 0.0f, 1.0f, 0.0f)));
    REQUIRE_FALSE(zc.setProfile(makeProfile(2.0f, 1.0f, -1.0f, 0.0f)));
    REQUIRE_FALSE(zc.setProfile(makeProfile(NAN, 1.0f, 1.0f, 0.0f)));
    REQUIRE(zc.profile().name == original);
}

TEST_CASE("Crop rectangle never leaves the source", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});

    SECTION("cursor in a corner")
    {
        zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));
        zoomInFully(zc, at(0, 0));
        REQUIRE(zc.cropRect() == CropRect{0, 0, 960, 540});
    }

    SECTION("overshooting easing near the far corner")
    {
        zc.setProfile(makeProfile(4.0f, 2.0f, 2.0f, 0.0f, Easing::Kind::EaseOutBack));
        zc.toggleZoom(at(1919, 1079));
        for (int i = 0; i < 60; ++i)
        {
            CropRect r = zc.advance(0.02f, at(1919, 1079));
            REQUIRE(r.x >= 0.0f);
            REQUIRE(r.y >= 0.0f);
            REQUIRE(r.width > 0.0f);
            REQUIRE(r.height > 0.0f);
            REQUIRE(r.x + r.width <= Approx(1920.0f));
            REQUIRE(r.y + r.height <= Approx(1080.0f));
        }
    }

    SECTION("zoom factor below 1 is a no-op zoom")
    {
        zc.setProfile(makeProfile(0.5f, 4.0f, 4.0f, 0.0f));
        zoomInFully(zc, at(300, 300));
        REQUIRE(zc.cropRect() == CropRect{0, 0, 1920, 1080});
    }
}

TEST_CASE("Zoom without any cursor aims at the source centre", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));

    zc.toggleZoom(MappedPoint{});
    REQUIRE(zc.targetCenter().x == Approx(960.0f));
    REQUIRE(zc.targetCenter().y == Approx(540.0f));
}

TEST_CASE("Source resize snaps back to idle", "[ZoomController]")
{
    ZoomController zc;
    zc.setSourceSize({1920, 1080});
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));
    zoomInFully(zc, at(500, 500));

    zc.setSourceSize({1920, 1080});   // unchanged: nothing happens
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);

    zc.setSourceSize({2560, 1440});
    REQUIRE(zc.mode() == ZoomController::Mode::Idle);
    REQUIRE(zc.cropRect() == CropRect{0, 0, 2560, 1440});
}

TEST_CASE("A toggle before the source size is known is kept", "[ZoomController]")
{
    ZoomController zc;
    zc.setProfile(makeProfile(2.0f, 4.0f, 4.0f, 0.0f));

    zc.toggleZoom(at(300, 200));
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingIn);

    zc.setSourceSize({1920, 1080});
    REQUIRE(zc.mode() == ZoomController::Mode::ZoomingIn);
    REQUIRE(zc.cropRect() == CropRect{0, 0, 1920, 1080});
    REQUIRE(zc.targetCenter().x == Approx(300.0f));
    REQUIRE(zc.targetCenter().y == Approx(200.0f));

    for (int i = 0; i < 20 && zc.mode() == ZoomController::Mode::ZoomingIn; ++i)
        zc.advance(0.05f, at(300, 200));
    REQUIRE(zc.mode() == ZoomController::Mode::Zoomed);
    REQUIRE(zc.cropRect() == CropRect{0, 0, 960, 540});
}

TEST_CASE("Without a source size the rectangle is empty", "[ZoomController]")
{
    ZoomController zc;
    zc.toggleZoom(at(10, 10));
    CropRect r = zc.advance(0.05f, at(10, 10));
    REQUIRE(r == CropRect{});
}

TEST_CASE("Mode names", "[ZoomController]")
{
    REQUIRE(std::string(toString(ZoomController::Mode::Idle)) == "idle");
    REQUIRE(std::string(toString(ZoomController::Mode::ZoomingIn)) == "zooming_in");
    REQUIRE(std::string(toString(ZoomController::Mode::Zoomed)) == "zoomed");
    REQUIRE(std::string(toString(ZoomController::Mode::ZoomingOut)) == "zooming_out");
}
