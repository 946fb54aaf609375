#pragma once

#include <cstdint>
#include <random>

namespace softblob {

// Point or displacement in shape space (origin at the shape centre,
// y pointing down like the drawing surface).
struct Vec2 {
  double x{0.0};
  double y{0.0};

  [[nodiscard]] bool operator==(const Vec2& other) const {
    return x == other.x && y == other.y;
  }

  [[nodiscard]] bool operator!=(const Vec2& other) const {
    return !(*this == other);
  }
};

struct Circle {
  Vec2 centre;
  double radius{0.0};
};

// Axis-aligned rectangle anchored at (x, y). Width and height may be
// negative; the helpers below accept either orientation.
struct Rect {
  double x{0.0};
  double y{0.0};
  double width{0.0};
  double height{0.0};
};

namespace math {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kTwoPi = 2.0 * kPi;

// Fraction (usually in [0,1]) that `value` represents between min and
// max. Works when max < min and when value lies outside the range.
[[nodiscard]] double Norm(double value, double min, double max);

// Inverse of Norm: value at fraction `norm` between min and max.
[[nodiscard]] double Lerp(double norm, double min, double max);

// Remap a value from one range into another.
[[nodiscard]] double Map(double value, double source_min, double source_max,
                         double dest_min, double dest_max);

// Clamp into [min(a,b), max(a,b)], so swapped bounds still work.
[[nodiscard]] double Clamp(double value, double min, double max);

[[nodiscard]] double Distance(const Vec2& a, const Vec2& b);

// True when the circles touch or overlap.
[[nodiscard]] bool CircleCollision(const Circle& c0, const Circle& c1);

// True when the point lies inside or exactly on the circle.
[[nodiscard]] bool CirclePointCollision(const Vec2& point,
                                        const Circle& circle);

[[nodiscard]] bool InRange(double value, double min, double max);
[[nodiscard]] bool PointInRect(const Vec2& point, const Rect& rect);
[[nodiscard]] bool RangeIntersect(double min0, double max0, double min1,
                                  double max1);
[[nodiscard]] bool RectIntersect(const Rect& r0, const Rect& r1);

[[nodiscard]] double DegreesToRadians(double degrees);
[[nodiscard]] double RadiansToDegrees(double radians);

[[nodiscard]] double RoundToPlaces(double value, int places);
[[nodiscard]] double RoundNearest(double value, double nearest);

// Rotate `point` by `angle` radians around the origin.
[[nodiscard]] Vec2 RotatePoint(const Vec2& point, double angle);

// Point on `origin + (cos(angle), sin(angle)) * distance`.
[[nodiscard]] Vec2 PolarOffset(const Vec2& origin, double angle,
                               double distance);

[[nodiscard]] Vec2 QuadraticBezier(const Vec2& p0, const Vec2& p1,
                                   const Vec2& p2, double t);
[[nodiscard]] Vec2 CubicBezier(const Vec2& p0, const Vec2& p1,
                               const Vec2& p2, const Vec2& p3, double t);

}  // namespace math

// Seedable pseudo-random source shared by the oscillator and the
// rotation step. A fixed seed makes a whole session reproducible.
class RandomSource {
 public:
  RandomSource();
  explicit RandomSource(std::uint32_t seed);

  void Reseed(std::uint32_t seed);

  // Uniform value in [0, 1).
  [[nodiscard]] double NextUnit();

  // Uniform value in [min, max); min may exceed max.
  [[nodiscard]] double Range(double min, double max);

  // Uniform integer in [min, max] inclusive.
  [[nodiscard]] int Int(int min, int max);

  // Mean of `iterations` uniform draws; the result clusters towards
  // the middle of the range as iterations grows.
  [[nodiscard]] double Distributed(double min, double max, int iterations);

 private:
  std::mt19937 engine_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

}  // namespace softblob
