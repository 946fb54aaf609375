#include "core/MathUtils.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace softblob {

namespace math {

double Norm(const double value, const double min, const double max)
{
  return (value - min) / (max - min);
}

double Lerp(const double norm, const double min, const double max)
{
  return (max - min) * norm + min;
}

double Map(const double value, const double source_min,
           const double source_max, const double dest_min,
           const double dest_max)
{
  return Lerp(Norm(value, source_min, source_max), dest_min, dest_max);
}

double Clamp(const double value, const double min, const double max)
{
  return std::min(std::max(value, std::min(min, max)), std::max(min, max));
}

double Distance(const Vec2& a, const Vec2& b)
{
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  return std::sqrt(dx * dx + dy * dy);
}

bool CircleCollision(const Circle& c0, const Circle& c1)
{
  return Distance(c0.centre, c1.centre) <= c0.radius + c1.radius;
}

bool CirclePointCollision(const Vec2& point, const Circle& circle)
{
  return Distance(circle.centre, point) <= circle.radius;
}

bool InRange(const double value, const double min, const double max)
{
  return value >= std::min(min, max) && value <= std::max(min, max);
}

bool PointInRect(const Vec2& point, const Rect& rect)
{
  return InRange(point.x, rect.x, rect.x + rect.width) &&
         InRange(point.y, rect.y, rect.y + rect.height);
}

bool RangeIntersect(const double min0, const double max0, const double min1,
                    const double max1)
{
  return std::max(min0, max0) >= std::min(min1, max1) &&
         std::min(min0, max0) <= std::max(min1, max1);
}

bool RectIntersect(const Rect& r0, const Rect& r1)
{
  return RangeIntersect(r0.x, r0.x + r0.width, r1.x, r1.x + r1.width) &&
         RangeIntersect(r0.y, r0.y + r0.height, r1.y, r1.y + r1.height);
}

double DegreesToRadians(const double degrees)
{
  return degrees / 180.0 * kPi;
}

double RadiansToDegrees(const double radians)
{
  return radians * 180.0 / kPi;
}

double RoundToPlaces(const double value, const int places)
{
  const double mult = std::pow(10.0, places);
  return std::round(value * mult) / mult;
}

double RoundNearest(const double value, const double nearest)
{
  return std::round(value / nearest) * nearest;
}

Vec2 RotatePoint(const Vec2& point, const double angle)
{
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return Vec2{point.x * c - point.y * s, point.y * c + point.x * s};
}

Vec2 PolarOffset(const Vec2& origin, const double angle,
                 const double distance)
{
  return Vec2{origin.x + std::cos(angle) * distance,
              origin.y + std::sin(angle) * distance};
}

Vec2 QuadraticBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2,
                     const double t)
{
  const double u = 1.0 - t;
  return Vec2{u * u * p0.x + 2.0 * u * t * p1.x + t * t * p2.x,
              u * u * p0.y + 2.0 * u * t * p1.y + t * t * p2.y};
}

Vec2 CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2,
                 const Vec2& p3, const double t)
{
  const double u = 1.0 - t;
  const double a = u * u * u;
  const double b = 3.0 * u * u * t;
  const double c = 3.0 * u * t * t;
  const double d = t * t * t;
  return Vec2{a * p0.x + b * p1.x + c * p2.x + d * p3.x,
              a * p0.y + b * p1.y + c * p2.y + d * p3.y};
}

}  // namespace math

RandomSource::RandomSource()
    : engine_(static_cast<std::uint32_t>(
          std::chrono::high_resolution_clock::now()
              .time_since_epoch()
              .count())) {}

RandomSource::RandomSource(const std::uint32_t seed) : engine_(seed) {}

void RandomSource::Reseed(const std::uint32_t seed)
{
  engine_.seed(seed);
  unit_.reset();
}

double RandomSource::NextUnit()
{
  return unit_(engine_);
}

double RandomSource::Range(const double min, const double max)
{
  return min + NextUnit() * (max - min);
}

int RandomSource::Int(const int min, const int max)
{
  // Span in double so that wide ranges like [INT_MIN, INT_MAX] do not
  // overflow int.
  const double span =
      static_cast<double>(max) - static_cast<double>(min) + 1.0;
  return static_cast<int>(
      std::floor(static_cast<double>(min) + NextUnit() * span));
}

double RandomSource::Distributed(const double min, const double max,
                                 const int iterations)
{
  if (iterations <= 0) {
    return min;
  }

  double total = 0.0;
  for (int i = 0; i < iterations; ++i) {
    total += Range(min, max);
  }
  return total / static_cast<double>(iterations);
}

}  // namespace softblob
