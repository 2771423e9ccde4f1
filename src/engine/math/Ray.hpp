#pragma once

#include <cmath>
#include <optional>
#include "Mat4.hpp"

namespace Engine::Math
{
    // Half-line origin + t * direction, t >= 0. The direction is not required to be
    // unit length: transformRay keeps t comparable between spaces by not renormalizing.
    struct Ray
    {
        Vec3 origin{0, 0, 0};
        Vec3 direction{0, 0, -1};
    };

    inline Vec3 pointAt(const Ray &ray, float t) { return ray.origin + ray.direction * t; }

    inline Ray transformRay(const Mat4 &m, const Ray &ray)
    {
        return Ray{transformPoint(m, ray.origin), transformDirection(m, ray.direction)};
    }

    // Double-sided Moller-Trumbore test. Returns the ray parameter of the hit.
    inline std::optional<float> intersectTriangle(const Ray &ray, const Vec3 &a, const Vec3 &b, const Vec3 &c)
    {
        constexpr float eps = 1e-7f;
        const Vec3 e1 = b - a;
        const Vec3 e2 = c - a;
        const Vec3 p = cross(ray.direction, e2);
        const float det = dot(e1, p);
        if (std::fabs(det) < eps)
            return std::nullopt;
        const float invDet = 1.0f / det;
        const Vec3 s = ray.origin - a;
        const float u = dot(s, p) * invDet;
        if (u < 0.0f || u > 1.0f)
            return std::nullopt;
        const Vec3 q = cross(s, e1);
        const float v = dot(ray.direction, q) * invDet;
        if (v < 0.0f || u + v > 1.0f)
            return std::nullopt;
        const float t = dot(e2, q) * invDet;
        if (t < 0.0f)
            return std::nullopt;
        return t;
    }

    inline std::optional<float> intersectSphere(const Ray &ray, const Vec3 &center, float radius)
    {
        const Vec3 oc = ray.origin - center;
        const float a = dot(ray.direction, ray.direction);
        if (a <= 0.0f)
            return std::nullopt;
        const float halfB = dot(oc, ray.direction);
        const float c = dot(oc, oc) - radius * radius;
        const float disc = halfB * halfB - a * c;
        if (disc < 0.0f)
            return std::nullopt;
        const float root = std::sqrt(disc);
        float t = (-halfB - root) / a;
        if (t < 0.0f)
            t = (-halfB + root) / a; // origin inside the sphere
        if (t < 0.0f)
            return std::nullopt;
        return t;
    }

    // Plane through `point` with normal `normal`; misses rays parallel to the plane
    inline std::optional<float> intersectPlane(const Ray &ray, const Vec3 &point, const Vec3 &normal)
    {
        const float denom = dot(normal, ray.direction);
        if (std::fabs(denom) < 1e-7f)
            return std::nullopt;
        const float t = dot(point - ray.origin, normal) / denom;
        if (t < 0.0f)
            return std::nullopt;
        return t;
    }

} // namespace Engine::Math
