#pragma once

#include <cstdint>
#include <string>

namespace softblob {

// Upper bound on the number of anchor points a shape may have.
inline constexpr int kMaxPointCount = 10000;

// Constants fixed when a shape is constructed. Defaults reproduce the
// classic five-point wobbling blob.
struct ShapeConfig {
  int point_count{5};
  double base_radius{250.0};

  // Maximum angular offset of a control point from its base angle, in
  // radians. Values <= 0 simply freeze the oscillation.
  double max_sweep_radians{3.14159265358979323846 / 6.0};

  // Per-tick angle advance is speed * step_scale * direction, with
  // speed drawn uniformly from [0, 1). Must be >= 0.
  double oscillation_step{0.02};

  // Whole-shape rotation, in radians per tick.
  double rotation_increment{0.0025};

  // Chance per rotating tick that the rotation direction flips.
  double rotation_reverse_probability{0.001};

  // Pointer distance (shape units) within which a control point is
  // picked up.
  double pick_radius{10.0};

  // Radius of the anchor/control point markers drawn by the overlay.
  double marker_radius{10.0};

  // 0 seeds the random source from the clock.
  std::uint32_t random_seed{0};
};

// Control-point distance factor for `point_count` cubic curves so that
// the outline approximates a circle: 4*(sqrt(2)-1)/3 scaled by 4/N.
[[nodiscard]] double RoundnessConstant(int point_count);

// Checks the geometry preconditions: 3..kMaxPointCount points, a finite
// positive radius, a positive roundness constant and a finite
// non-negative oscillation step. Fills `error` with a reason when the
// configuration is rejected.
[[nodiscard]] bool ValidateShapeConfig(const ShapeConfig& config,
                                       std::string* error = nullptr);

}  // namespace softblob
