#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/MathUtils.h"
#include "core/ShapeConfig.h"

namespace softblob {

// Indices into BlobShape's anchor and control point tables. Curves and
// anchor pairings refer to points exclusively through these indices, so
// a write through one path is always visible through the other.
using AnchorIndex = std::size_t;
using ControlPointIndex = std::size_t;

enum class SweepDirection {
  kBackward = -1,
  kForward = 1,
};

[[nodiscard]] inline double DirectionSign(const SweepDirection direction)
{
  return direction == SweepDirection::kForward ? 1.0 : -1.0;
}

// Off-curve point bending one side of a cubic segment. Outside of an
// active drag its position is always
//   anchor.position + (cos(current_angle), sin(current_angle)) * R * k.
struct ControlPoint {
  Vec2 position;
  double base_angle{0.0};
  double current_angle{0.0};
  AnchorIndex owner{0};
};

// On-curve point lying on the base circle.
struct AnchorPoint {
  Vec2 position;

  // Angular distance from the start of the loop, i*(2*pi/N). The anchor
  // itself sits at start_angle + placement_increment.
  double placement_increment{0.0};

  // Control points adjacent to this anchor: the second control point of
  // the incoming curve, then the first control point of the outgoing
  // curve. Fixed once the shape is built.
  std::array<ControlPointIndex, 2> paired{{0, 0}};

  SweepDirection sweep_direction{SweepDirection::kForward};
  double sweep_speed{0.0};
};

// One cubic segment: start anchor, two control points, end anchor.
struct Curve {
  AnchorIndex start{0};
  ControlPointIndex first_control{0};
  ControlPointIndex second_control{0};
  AnchorIndex end{0};
};

// Resolved coordinates of a Curve, in drawing order.
struct CurveGeometry {
  Vec2 start;
  Vec2 first_control;
  Vec2 second_control;
  Vec2 end;
};

struct OscillationParams {
  double max_sweep_radians{0.0};
  double step_scale{0.0};
};

// Closed outline of N cubic curves running clockwise from the top of
// the base circle. Cardinality is fixed at construction; only angles
// and positions change afterwards.
class BlobShape {
 public:
  // The starting angle of the loop: the top of the circle.
  static constexpr double kStartAngle = -math::kPi / 2.0;

  BlobShape() = default;

  [[nodiscard]] bool empty() const { return anchors_.empty(); }
  [[nodiscard]] std::size_t point_count() const { return anchors_.size(); }

  [[nodiscard]] double base_radius() const { return base_radius_; }
  [[nodiscard]] double roundness() const { return roundness_; }

  // Distance of every control point from its owning anchor (R * k).
  [[nodiscard]] double control_distance() const
  {
    return base_radius_ * roundness_;
  }

  [[nodiscard]] const std::vector<AnchorPoint>& anchors() const
  {
    return anchors_;
  }

  [[nodiscard]] const std::vector<ControlPoint>& control_points() const
  {
    return control_points_;
  }

  // Curves in stable clockwise order; curves()[i].end equals
  // curves()[(i + 1) % N].start.
  [[nodiscard]] const std::vector<Curve>& curves() const { return curves_; }

  [[nodiscard]] CurveGeometry ResolveCurve(std::size_t curve_index) const;

  // Position the control point would have if it followed its stored
  // angle, regardless of any drag override.
  [[nodiscard]] Vec2 DerivedControlPointPosition(
      ControlPointIndex index) const;

  // Direct write used while dragging. Angle bookkeeping is left alone;
  // the next oscillation tick re-derives the position from the stored
  // angle. Returns false for an out-of-range index.
  bool SetControlPointPosition(ControlPointIndex index, const Vec2& position);

  // First control point (curve order, then slot 1 before slot 2) within
  // `pick_radius` of `point`, or nullopt.
  [[nodiscard]] std::optional<ControlPointIndex> FindControlPointAt(
      const Vec2& point, double pick_radius) const;

  // Advances every anchor's paired control points by one oscillation
  // step and re-derives their positions. `pinned` (the point currently
  // being dragged) keeps its position. Returns the number of anchors
  // whose sweep direction flipped during this tick.
  std::size_t ApplyOscillationTick(
      const OscillationParams& params, RandomSource& random,
      std::optional<ControlPointIndex> pinned = std::nullopt);

 private:
  friend bool BuildBlobShape(const ShapeConfig& config, RandomSource& random,
                             BlobShape& shape, std::string* error);

  void RecomputeControlPointPosition(ControlPointIndex index);

  double base_radius_{0.0};
  double roundness_{0.0};
  std::vector<AnchorPoint> anchors_;
  std::vector<ControlPoint> control_points_;
  std::vector<Curve> curves_;
};

// Builds anchors, curves and anchor pairings from `config`. On failure
// `shape` is left untouched and `error` describes the rejected
// configuration. Sweep speeds are drawn from `random`.
bool BuildBlobShape(const ShapeConfig& config, RandomSource& random,
                    BlobShape& shape, std::string* error = nullptr);

}  // namespace softblob
