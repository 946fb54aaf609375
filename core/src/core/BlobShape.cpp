#include "core/BlobShape.h"

#include <initializer_list>
#include <utility>

#include "core/MidpointOscillator.h"

namespace softblob {

CurveGeometry BlobShape::ResolveCurve(const std::size_t curve_index) const
{
  const Curve& curve = curves_[curve_index];
  return CurveGeometry{anchors_[curve.start].position,
                       control_points_[curve.first_control].position,
                       control_points_[curve.second_control].position,
                       anchors_[curve.end].position};
}

Vec2 BlobShape::DerivedControlPointPosition(
    const ControlPointIndex index) const
{
  const ControlPoint& point = control_points_[index];
  return math::PolarOffset(anchors_[point.owner].position,
                           point.current_angle, control_distance());
}

void BlobShape::RecomputeControlPointPosition(const ControlPointIndex index)
{
  control_points_[index].position = DerivedControlPointPosition(index);
}

bool BlobShape::SetControlPointPosition(const ControlPointIndex index,
                                        const Vec2& position)
{
  if (index >= control_points_.size()) {
    return false;
  }
  control_points_[index].position = position;
  return true;
}

std::optional<ControlPointIndex> BlobShape::FindControlPointAt(
    const Vec2& point, const double pick_radius) const
{
  for (const auto& curve : curves_) {
    for (const ControlPointIndex index :
         {curve.first_control, curve.second_control}) {
      const Circle target{control_points_[index].position, pick_radius};
      if (math::CirclePointCollision(point, target)) {
        return index;
      }
    }
  }
  return std::nullopt;
}

std::size_t BlobShape::ApplyOscillationTick(
    const OscillationParams& params, RandomSource& random,
    const std::optional<ControlPointIndex> pinned)
{
  std::size_t reversed = 0;
  for (auto& anchor : anchors_) {
    ControlPoint& incoming = control_points_[anchor.paired[0]];
    ControlPoint& outgoing = control_points_[anchor.paired[1]];
    if (AdvanceSweep(anchor, incoming, outgoing, params, random)) {
      ++reversed;
    }

    for (const ControlPointIndex index : anchor.paired) {
      if (pinned.has_value() && *pinned == index) {
        continue;
      }
      RecomputeControlPointPosition(index);
    }
  }
  return reversed;
}

bool BuildBlobShape(const ShapeConfig& config, RandomSource& random,
                    BlobShape& shape, std::string* error)
{
  if (!ValidateShapeConfig(config, error)) {
    return false;
  }

  const std::size_t count = static_cast<std::size_t>(config.point_count);
  const double increment = math::kTwoPi / static_cast<double>(count);

  BlobShape built;
  built.base_radius_ = config.base_radius;
  built.roundness_ = RoundnessConstant(config.point_count);

  // Anchors, clockwise from the top of the circle.
  built.anchors_.resize(count);
  for (std::size_t i = 0; i < count; ++i) {
    AnchorPoint& anchor = built.anchors_[i];
    anchor.placement_increment = static_cast<double>(i) * increment;
    anchor.position =
        math::PolarOffset(Vec2{}, BlobShape::kStartAngle +
                                      anchor.placement_increment,
                          config.base_radius);
  }

  // One curve per neighbouring anchor pair. Control point 2i leaves
  // anchor i along the clockwise tangent, control point 2i+1 arrives at
  // anchor i+1 pointing back towards anchor i.
  built.control_points_.resize(count * 2U);
  built.curves_.resize(count);
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t next = (i + 1U) % count;

    Curve& curve = built.curves_[i];
    curve.start = i;
    curve.first_control = 2U * i;
    curve.second_control = 2U * i + 1U;
    curve.end = next;

    ControlPoint& first = built.control_points_[curve.first_control];
    first.owner = i;
    first.base_angle = built.anchors_[i].placement_increment;
    first.current_angle = first.base_angle;

    ControlPoint& second = built.control_points_[curve.second_control];
    second.owner = next;
    second.base_angle = built.anchors_[next].placement_increment - math::kPi;
    second.current_angle = second.base_angle;
  }

  for (std::size_t index = 0; index < built.control_points_.size();
       ++index) {
    built.RecomputeControlPointPosition(index);
  }

  // Pair each anchor with the control points on either side of it.
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t previous = (i + count - 1U) % count;
    AnchorPoint& anchor = built.anchors_[i];
    anchor.paired = {built.curves_[previous].second_control,
                     built.curves_[i].first_control};
    anchor.sweep_direction = SweepDirection::kForward;
    anchor.sweep_speed = random.NextUnit();
  }

  shape = std::move(built);
  return true;
}

}  // namespace softblob
