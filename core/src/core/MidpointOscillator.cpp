#include "core/MidpointOscillator.h"

#include <algorithm>

namespace softblob {

namespace {

double SweepOffset(const ControlPoint& point)
{
  return point.current_angle - point.base_angle;
}

void ClampSweep(ControlPoint& point, const double limit)
{
  const double offset = std::clamp(SweepOffset(point), -limit, limit);
  point.current_angle = point.base_angle + offset;
}

}  // namespace

bool AdvanceSweep(AnchorPoint& anchor, ControlPoint& incoming,
                  ControlPoint& outgoing, const OscillationParams& params,
                  RandomSource& random)
{
  // A non-positive arc freezes the points at their base angle.
  const double limit = std::max(0.0, params.max_sweep_radians);

  const double delta =
      anchor.sweep_speed * params.step_scale *
      DirectionSign(anchor.sweep_direction);
  incoming.current_angle += delta;
  outgoing.current_angle += delta;

  const bool reached_upper =
      SweepOffset(incoming) >= limit || SweepOffset(outgoing) >= limit;
  const bool reached_lower =
      SweepOffset(incoming) <= -limit || SweepOffset(outgoing) <= -limit;

  ClampSweep(incoming, limit);
  ClampSweep(outgoing, limit);

  const SweepDirection previous = anchor.sweep_direction;
  if (reached_upper) {
    anchor.sweep_direction = SweepDirection::kBackward;
    anchor.sweep_speed = random.NextUnit();
  } else if (reached_lower) {
    anchor.sweep_direction = SweepDirection::kForward;
    anchor.sweep_speed = random.NextUnit();
  }

  return anchor.sweep_direction != previous;
}

}  // namespace softblob
