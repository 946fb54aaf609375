#include "core/ShapeConfig.h"

#include <cmath>

namespace softblob {

namespace {

// Kappa for a quarter circle.
const double kQuarterCircleKappa = 4.0 * (std::sqrt(2.0) - 1.0) / 3.0;

void SetError(std::string* error, const std::string& reason)
{
  if (error != nullptr) {
    *error = "invalid configuration: " + reason;
  }
}

}  // namespace

double RoundnessConstant(const int point_count)
{
  if (point_count <= 0) {
    return 0.0;
  }
  return kQuarterCircleKappa / (static_cast<double>(point_count) / 4.0);
}

bool ValidateShapeConfig(const ShapeConfig& config, std::string* error)
{
  if (config.point_count < 3) {
    SetError(error, "point count must be at least 3 (got " +
                        std::to_string(config.point_count) + ")");
    return false;
  }
  if (config.point_count > kMaxPointCount) {
    SetError(error, "point count must be at most " +
                        std::to_string(kMaxPointCount) + " (got " +
                        std::to_string(config.point_count) + ")");
    return false;
  }

  if (!std::isfinite(config.base_radius) || config.base_radius <= 0.0) {
    SetError(error, "base radius must be a positive number (got " +
                        std::to_string(config.base_radius) + ")");
    return false;
  }

  const double k = RoundnessConstant(config.point_count);
  if (!std::isfinite(k) || k <= 0.0) {
    SetError(error, "roundness constant must be positive");
    return false;
  }

  // A negative step pins every sweep at its lower bound.
  if (!std::isfinite(config.oscillation_step) ||
      config.oscillation_step < 0.0) {
    SetError(error, "oscillation step must be a non-negative number (got " +
                        std::to_string(config.oscillation_step) + ")");
    return false;
  }

  if (error != nullptr) {
    error->clear();
  }
  return true;
}

}  // namespace softblob
