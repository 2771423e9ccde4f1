#pragma once

#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>
#include "../math/Mat4.hpp"

namespace Engine::Gfx
{
    using Engine::Math::Vec3;

    // Open centripetal Catmull-Rom spline through a list of control points.
    // The curve is parameterized over t in [0, 1]; each control-point span gets an
    // equal share of t. End spans are extrapolated by mirroring the neighbour point.
    class CatmullRomCurve
    {
    public:
        CatmullRomCurve() = default;
        explicit CatmullRomCurve(std::vector<Vec3> points)
            : m_points(std::move(points)) {}

        std::size_t controlPointCount() const { return m_points.size(); }
        const std::vector<Vec3> &controlPoints() const { return m_points; }

        Vec3 point(float t) const
        {
            const std::size_t n = m_points.size();
            if (n == 0)
                return {0.0f, 0.0f, 0.0f};
            if (n == 1)
                return m_points.front();

            t = t < 0.0f ? 0.0f : (t > 1.0f ? 1.0f : t);
            const float p = static_cast<float>(n - 1) * t;
            std::size_t seg = static_cast<std::size_t>(std::floor(p));
            float weight = p - static_cast<float>(seg);
            if (seg >= n - 1)
            {
                seg = n - 2;
                weight = 1.0f;
            }

            const Vec3 &p1 = m_points[seg];
            const Vec3 &p2 = m_points[seg + 1];
            const Vec3 p0 = seg > 0 ? m_points[seg - 1] : p1 + (p1 - p2);
            const Vec3 p3 = seg + 2 < n ? m_points[seg + 2] : p2 + (p2 - p1);

            // Centripetal knot spacing: |pi - pj|^0.5
            float dt0 = std::pow(Engine::Math::distanceSquared(p0, p1), 0.25f);
            float dt1 = std::pow(Engine::Math::distanceSquared(p1, p2), 0.25f);
            float dt2 = std::pow(Engine::Math::distanceSquared(p2, p3), 0.25f);
            if (dt1 < 1e-4f)
                dt1 = 1.0f;
            if (dt0 < 1e-4f)
                dt0 = dt1;
            if (dt2 < 1e-4f)
                dt2 = dt1;

            return Vec3{evaluate(p0.x, p1.x, p2.x, p3.x, dt0, dt1, dt2, weight),
                        evaluate(p0.y, p1.y, p2.y, p3.y, dt0, dt1, dt2, weight),
                        evaluate(p0.z, p1.z, p2.z, p3.z, dt0, dt1, dt2, weight)};
        }

        // Central-difference tangent, normalized. Zero when the curve is locally degenerate.
        Vec3 tangent(float t) const
        {
            constexpr float delta = 1e-4f;
            float t1 = t - delta;
            float t2 = t + delta;
            if (t1 < 0.0f)
                t1 = 0.0f;
            if (t2 > 1.0f)
                t2 = 1.0f;
            return Engine::Math::normalize(point(t2) - point(t1));
        }

    private:
        static float evaluate(float x0, float x1, float x2, float x3,
                              float dt0, float dt1, float dt2, float w)
        {
            // Hermite tangents for non-uniform knots, rescaled to [0, 1] on the middle span
            float t1 = (x1 - x0) / dt0 - (x2 - x0) / (dt0 + dt1) + (x2 - x1) / dt1;
            float t2 = (x2 - x1) / dt1 - (x3 - x1) / (dt1 + dt2) + (x3 - x2) / dt2;
            t1 *= dt1;
            t2 *= dt1;

            const float c0 = x1;
            const float c1 = t1;
            const float c2 = -3.0f * x1 + 3.0f * x2 - 2.0f * t1 - t2;
            const float c3 = 2.0f * x1 - 2.0f * x2 + t1 + t2;
            return c0 + c1 * w + c2 * w * w + c3 * w * w * w;
        }

        std::vector<Vec3> m_points;
    };

} // namespace Engine::Gfx
