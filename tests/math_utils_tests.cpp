#include <cassert>
#include <climits>
#include <cmath>
#include <iostream>

#include "core/MathUtils.h"

// Contracts of the small math helper library used by the blob model.

using softblob::Circle;
using softblob::RandomSource;
using softblob::Rect;
using softblob::Vec2;
namespace math = softblob::math;

namespace {

bool near(const double a, const double b, const double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

bool near(const Vec2& a, const Vec2& b, const double eps = 1e-9)
{
    return near(a.x, b.x, eps) && near(a.y, b.y, eps);
}

}  // namespace

int main()
{
    // Normalisation and interpolation.
    assert(near(math::Norm(5.0, 0.0, 10.0), 0.5));
    assert(near(math::Norm(5.0, 10.0, 0.0), 0.5));
    assert(near(math::Norm(15.0, 0.0, 10.0), 1.5));
    assert(near(math::Lerp(0.25, 0.0, 8.0), 2.0));
    assert(near(math::Map(5.0, 0.0, 10.0, 100.0, 200.0), 150.0));

    // Clamp accepts bounds in either order.
    assert(near(math::Clamp(12.0, 0.0, 10.0), 10.0));
    assert(near(math::Clamp(-3.0, 0.0, 10.0), 0.0));
    assert(near(math::Clamp(12.0, 10.0, 0.0), 10.0));
    assert(near(math::Clamp(-3.0, 10.0, 0.0), 0.0));
    assert(near(math::Clamp(4.0, 10.0, 0.0), 4.0));

    // Distance and collisions; the boundary counts as a hit.
    assert(near(math::Distance(Vec2{0.0, 0.0}, Vec2{3.0, 4.0}), 5.0));
    assert(math::CirclePointCollision(Vec2{3.0, 4.0},
                                      Circle{Vec2{0.0, 0.0}, 5.0}));
    assert(!math::CirclePointCollision(Vec2{3.0, 4.1},
                                       Circle{Vec2{0.0, 0.0}, 5.0}));
    assert(math::CircleCollision(Circle{Vec2{0.0, 0.0}, 2.0},
                                 Circle{Vec2{5.0, 0.0}, 3.0}));
    assert(!math::CircleCollision(Circle{Vec2{0.0, 0.0}, 2.0},
                                  Circle{Vec2{5.1, 0.0}, 3.0}));

    // Ranges and rectangles, including negative extents.
    assert(math::InRange(5.0, 10.0, 0.0));
    assert(!math::InRange(11.0, 0.0, 10.0));
    assert(math::PointInRect(Vec2{5.0, 5.0}, Rect{0.0, 0.0, 10.0, 10.0}));
    assert(math::PointInRect(Vec2{-5.0, -5.0},
                             Rect{0.0, 0.0, -10.0, -10.0}));
    assert(!math::PointInRect(Vec2{11.0, 5.0}, Rect{0.0, 0.0, 10.0, 10.0}));
    assert(math::RangeIntersect(0.0, 5.0, 4.0, 9.0));
    assert(!math::RangeIntersect(0.0, 5.0, 6.0, 9.0));
    assert(math::RectIntersect(Rect{0.0, 0.0, 10.0, 10.0},
                               Rect{5.0, 5.0, 10.0, 10.0}));
    assert(!math::RectIntersect(Rect{0.0, 0.0, 10.0, 10.0},
                                Rect{20.0, 0.0, 10.0, 10.0}));

    // Angles and rounding.
    assert(near(math::DegreesToRadians(180.0), math::kPi));
    assert(near(math::RadiansToDegrees(math::kPi / 6.0), 30.0));
    assert(near(math::RoundToPlaces(3.14159, 2), 3.14));
    assert(near(math::RoundNearest(17.0, 5.0), 15.0));
    assert(near(math::RoundNearest(18.0, 5.0), 20.0));

    assert(near(math::RotatePoint(Vec2{1.0, 0.0}, math::kPi / 2.0),
                Vec2{0.0, 1.0}));
    assert(near(math::PolarOffset(Vec2{10.0, 10.0}, math::kPi, 5.0),
                Vec2{5.0, 10.0}));

    // Bezier evaluation hits the endpoints exactly.
    {
        const Vec2 p0{0.0, 0.0};
        const Vec2 p1{0.0, 10.0};
        const Vec2 p2{10.0, 10.0};
        const Vec2 p3{10.0, 0.0};
        assert(near(math::CubicBezier(p0, p1, p2, p3, 0.0), p0));
        assert(near(math::CubicBezier(p0, p1, p2, p3, 1.0), p3));
        assert(near(math::CubicBezier(p0, p1, p2, p3, 0.5), Vec2{5.0, 7.5}));
        assert(near(math::QuadraticBezier(p0, p1, p2, 0.5), Vec2{2.5, 7.5}));
    }

    // Random source: ranges hold and a fixed seed is reproducible.
    {
        RandomSource a(1234U);
        RandomSource b(1234U);
        bool sawMin = false;
        bool sawMax = false;
        for (int i = 0; i < 2000; ++i) {
            const double unit = a.NextUnit();
            assert(unit >= 0.0 && unit < 1.0);
            assert(near(unit, b.NextUnit(), 0.0));

            const double r = a.Range(-10.0, 10.0);
            assert(r >= -10.0 && r < 10.0);
            assert(near(r, b.Range(-10.0, 10.0), 0.0));

            const int n = a.Int(1, 3);
            assert(n >= 1 && n <= 3);
            sawMin = sawMin || n == 1;
            sawMax = sawMax || n == 3;
            assert(n == b.Int(1, 3));

            const double d = a.Distributed(0.0, 100.0, 4);
            assert(d >= 0.0 && d < 100.0);
            assert(near(d, b.Distributed(0.0, 100.0, 4), 0.0));
        }
        assert(sawMin && sawMax);

        a.Reseed(99U);
        b.Reseed(99U);
        assert(near(a.NextUnit(), b.NextUnit(), 0.0));
    }

    // Integer draws across the full int range stay in bounds.
    {
        RandomSource random(7U);
        bool sawNegative = false;
        bool sawPositive = false;
        for (int i = 0; i < 1000; ++i) {
            const int n = random.Int(INT_MIN, INT_MAX);
            sawNegative = sawNegative || n < 0;
            sawPositive = sawPositive || n > 0;
            assert(random.Int(INT_MIN, 0) <= 0);
            assert(random.Int(INT_MAX, INT_MAX) == INT_MAX);
            assert(random.Int(INT_MIN, INT_MIN) == INT_MIN);
        }
        assert(sawNegative && sawPositive);
    }

    std::cout << "softblob-math-tests: OK" << std::endl;
    return 0;
}
