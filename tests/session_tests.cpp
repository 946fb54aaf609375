#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "core/BlobSession.h"

// Frame ticks, toggles and drag capture on a whole session.

using softblob::AdvanceFrame;
using softblob::ApplyToggle;
using softblob::BeginCapture;
using softblob::BlobSession;
using softblob::DisplayToggles;
using softblob::EndCapture;
using softblob::InitialiseSession;
using softblob::ShapeConfig;
using softblob::SweepDirection;
using softblob::ToggleAction;
using softblob::UpdateCapture;
using softblob::Vec2;

namespace {

bool near(const double a, const double b, const double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

bool near(const Vec2& a, const Vec2& b, const double eps = 1e-9)
{
    return near(a.x, b.x, eps) && near(a.y, b.y, eps);
}

ShapeConfig seededConfig(const std::uint32_t seed)
{
    ShapeConfig config;
    config.random_seed = seed;
    return config;
}

}  // namespace

int main()
{
    // Defaults: overlays visible, everything else off.
    {
        BlobSession session;
        assert(InitialiseSession(session, seededConfig(1U)));
        assert(session.shape.point_count() == 5U);
        assert(session.toggles.show_markers);
        assert(session.toggles.show_connectors);
        assert(!session.toggles.animating);
        assert(!session.toggles.filled);
        assert(!session.toggles.rotating);
        assert(!session.captured.has_value());
        assert(session.rotation_radians == 0.0);
    }

    // Every toggle applied twice restores the original state.
    {
        BlobSession session;
        assert(InitialiseSession(session, seededConfig(2U)));
        for (const auto action :
             {ToggleAction::kOverlays, ToggleAction::kAnimate,
              ToggleAction::kFill, ToggleAction::kRotate}) {
            const DisplayToggles before = session.toggles;
            const DisplayToggles once = ApplyToggle(session, action);
            assert(once != before);
            ApplyToggle(session, action);
            assert(session.toggles == before);
        }

        // Overlays flip markers and connectors together.
        ApplyToggle(session, ToggleAction::kOverlays);
        assert(!session.toggles.show_markers);
        assert(!session.toggles.show_connectors);
        assert(std::string(softblob::ToggleActionName(
                   ToggleAction::kOverlays)) == "overlays");
    }

    // Idle frames change nothing.
    {
        BlobSession session;
        assert(InitialiseSession(session, seededConfig(3U)));
        const auto before = session.shape.control_points();
        for (int i = 0; i < 50; ++i) {
            const auto result = AdvanceFrame(session);
            assert(!result.rotation_reversed);
            assert(result.sweeps_reversed == 0U);
        }
        assert(session.rotation_radians == 0.0);
        for (std::size_t i = 0; i < before.size(); ++i) {
            assert(session.shape.control_points()[i].position ==
                   before[i].position);
        }
    }

    // Rotation advances by the configured increment.
    {
        ShapeConfig config = seededConfig(4U);
        config.rotation_reverse_probability = 0.0;
        BlobSession session;
        assert(InitialiseSession(session, config));
        ApplyToggle(session, ToggleAction::kRotate);
        for (int i = 0; i < 10; ++i) {
            assert(!AdvanceFrame(session).rotation_reversed);
        }
        assert(near(session.rotation_radians, 10.0 * 0.0025));
        assert(session.rotation_direction == SweepDirection::kForward);
    }

    // A certain reversal flips the direction on every frame.
    {
        ShapeConfig config = seededConfig(5U);
        config.rotation_reverse_probability = 1.0;
        BlobSession session;
        assert(InitialiseSession(session, config));
        ApplyToggle(session, ToggleAction::kRotate);

        assert(AdvanceFrame(session).rotation_reversed);
        assert(near(session.rotation_radians, 0.0025));
        assert(session.rotation_direction == SweepDirection::kBackward);

        assert(AdvanceFrame(session).rotation_reversed);
        assert(near(session.rotation_radians, 0.0));
        assert(session.rotation_direction == SweepDirection::kForward);
    }

    // Capture lifecycle: hit, single capture, exact moves, release.
    {
        BlobSession session;
        assert(InitialiseSession(session, seededConfig(6U)));

        assert(!BeginCapture(session, Vec2{0.0, 0.0}).has_value());
        assert(!session.captured.has_value());
        assert(!UpdateCapture(session, Vec2{1.0, 1.0}));
        assert(!EndCapture(session));

        const Vec2 target = session.shape.control_points()[4].position;
        const auto captured =
            BeginCapture(session, Vec2{target.x + 3.0, target.y - 4.0});
        assert(captured.has_value());
        assert(*captured == 4U);
        assert(session.captured == captured);

        // A second press does not steal the capture.
        const Vec2 other = session.shape.control_points()[0].position;
        assert(!BeginCapture(session, other).has_value());
        assert(session.captured.has_value() && *session.captured == 4U);

        assert(UpdateCapture(session, Vec2{-321.5, 77.25}));
        assert(session.shape.control_points()[4].position ==
               (Vec2{-321.5, 77.25}));
        assert(UpdateCapture(session, Vec2{10.0, 20.0}));
        assert(session.shape.control_points()[4].position ==
               (Vec2{10.0, 20.0}));

        assert(EndCapture(session));
        assert(!session.captured.has_value());
        assert(!UpdateCapture(session, Vec2{0.0, 0.0}));
        assert(session.shape.control_points()[4].position ==
               (Vec2{10.0, 20.0}));
    }

    // While animating, the captured point keeps its dragged position;
    // after release the next frame re-derives it from its angle.
    {
        BlobSession session;
        assert(InitialiseSession(session, seededConfig(7U)));
        ApplyToggle(session, ToggleAction::kAnimate);

        const Vec2 start = session.shape.control_points()[0].position;
        assert(BeginCapture(session, start).has_value());
        assert(UpdateCapture(session, Vec2{1000.0, 1000.0}));

        for (int i = 0; i < 30; ++i) {
            AdvanceFrame(session);
        }
        assert(session.shape.control_points()[0].position ==
               (Vec2{1000.0, 1000.0}));
        for (std::size_t i = 1; i < session.shape.control_points().size();
             ++i) {
            assert(near(session.shape.control_points()[i].position,
                        session.shape.DerivedControlPointPosition(i)));
        }

        assert(EndCapture(session));
        AdvanceFrame(session);
        assert(near(session.shape.control_points()[0].position,
                    session.shape.DerivedControlPointPosition(0U)));
    }

    // Same seed, same frames, same outline.
    {
        BlobSession a;
        BlobSession b;
        assert(InitialiseSession(a, seededConfig(8U)));
        assert(InitialiseSession(b, seededConfig(8U)));
        for (auto* session : {&a, &b}) {
            ApplyToggle(*session, ToggleAction::kAnimate);
            ApplyToggle(*session, ToggleAction::kRotate);
            for (int i = 0; i < 300; ++i) {
                AdvanceFrame(*session);
            }
        }
        assert(a.rotation_radians == b.rotation_radians);
        for (std::size_t i = 0; i < a.shape.control_points().size(); ++i) {
            assert(a.shape.control_points()[i].position ==
                   b.shape.control_points()[i].position);
        }
    }

    // A rejected configuration leaves the running session alone.
    {
        BlobSession session;
        assert(InitialiseSession(session, seededConfig(9U)));
        ApplyToggle(session, ToggleAction::kFill);

        ShapeConfig bad = seededConfig(9U);
        bad.point_count = 2;
        std::string error;
        assert(!InitialiseSession(session, bad, DisplayToggles{}, &error));
        assert(error.find("invalid configuration") != std::string::npos);
        assert(session.shape.point_count() == 5U);
        assert(session.config.point_count == 5);
        assert(session.toggles.filled);
    }

    std::cout << "softblob-session-tests: OK" << std::endl;
    return 0;
}
