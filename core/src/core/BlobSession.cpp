#include "core/BlobSession.h"

#include <utility>

namespace softblob {

const char* ToggleActionName(const ToggleAction action)
{
  switch (action) {
    case ToggleAction::kOverlays:
      return "overlays";
    case ToggleAction::kAnimate:
      return "animate";
    case ToggleAction::kFill:
      return "fill";
    case ToggleAction::kRotate:
      return "rotate";
  }
  return "unknown";
}

bool InitialiseSession(BlobSession& session, const ShapeConfig& config,
                       const DisplayToggles& toggles, std::string* error)
{
  RandomSource random;
  if (config.random_seed != 0U) {
    random.Reseed(config.random_seed);
  }

  BlobShape shape;
  if (!BuildBlobShape(config, random, shape, error)) {
    return false;
  }

  session.config = config;
  session.shape = std::move(shape);
  session.random = random;
  session.toggles = toggles;
  session.rotation_radians = 0.0;
  session.rotation_direction = SweepDirection::kForward;
  session.captured.reset();
  return true;
}

FrameTickResult AdvanceFrame(BlobSession& session)
{
  FrameTickResult result;

  if (session.toggles.rotating) {
    session.rotation_radians += session.config.rotation_increment *
                                DirectionSign(session.rotation_direction);

    if (session.random.NextUnit() <
        session.config.rotation_reverse_probability) {
      session.rotation_direction =
          session.rotation_direction == SweepDirection::kForward
              ? SweepDirection::kBackward
              : SweepDirection::kForward;
      result.rotation_reversed = true;
    }
  }

  if (session.toggles.animating) {
    const OscillationParams params{session.config.max_sweep_radians,
                                   session.config.oscillation_step};
    result.sweeps_reversed = session.shape.ApplyOscillationTick(
        params, session.random, session.captured);
  }

  return result;
}

const DisplayToggles& ApplyToggle(BlobSession& session,
                                  const ToggleAction action)
{
  DisplayToggles& toggles = session.toggles;
  switch (action) {
    case ToggleAction::kOverlays:
      toggles.show_markers = !toggles.show_markers;
      toggles.show_connectors = !toggles.show_connectors;
      break;
    case ToggleAction::kAnimate:
      toggles.animating = !toggles.animating;
      break;
    case ToggleAction::kFill:
      toggles.filled = !toggles.filled;
      break;
    case ToggleAction::kRotate:
      toggles.rotating = !toggles.rotating;
      break;
  }
  return toggles;
}

std::optional<ControlPointIndex> BeginCapture(BlobSession& session,
                                              const Vec2& shape_point)
{
  if (session.captured.has_value()) {
    return std::nullopt;
  }

  session.captured = session.shape.FindControlPointAt(
      shape_point, session.config.pick_radius);
  return session.captured;
}

bool UpdateCapture(BlobSession& session, const Vec2& shape_point)
{
  if (!session.captured.has_value()) {
    return false;
  }
  return session.shape.SetControlPointPosition(*session.captured,
                                               shape_point);
}

bool EndCapture(BlobSession& session)
{
  if (!session.captured.has_value()) {
    return false;
  }
  session.captured.reset();
  return true;
}

}  // namespace softblob
