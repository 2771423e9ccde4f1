#pragma once

#include <algorithm>
#include <cmath>
#include <array>

namespace Engine::Math
{
    constexpr float kPi = 3.1415926535f;
    constexpr float kTwoPi = 2.0f * kPi;

    struct Vec2
    {
        float x{0.0f};
        float y{0.0f};
    };

    struct Vec3
    {
        float x{0.0f};
        float y{0.0f};
        float z{0.0f};

        Vec3() = default;
        Vec3(float xx, float yy, float zz) : x(xx), y(yy), z(zz) {}
    };

    inline Vec3 operator+(const Vec3 &a, const Vec3 &b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    inline Vec3 operator-(const Vec3 &a, const Vec3 &b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    inline Vec3 operator-(const Vec3 &a) { return {-a.x, -a.y, -a.z}; }
    inline Vec3 operator*(const Vec3 &a, float s) { return {a.x * s, a.y * s, a.z * s}; }
    inline Vec3 operator*(float s, const Vec3 &a) { return a * s; }
    inline Vec3 operator/(const Vec3 &a, float s) { return {a.x / s, a.y / s, a.z / s}; }

    inline float dot(const Vec3 &a, const Vec3 &b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
    inline Vec3 cross(const Vec3 &a, const Vec3 &b)
    {
        return {a.y * b.z - a.z * b.y,
                a.z * b.x - a.x * b.z,
                a.x * b.y - a.y * b.x};
    }
    inline float lengthSquared(const Vec3 &v) { return dot(v, v); }
    inline float length(const Vec3 &v) { return std::sqrt(dot(v, v)); }
    inline float distanceSquared(const Vec3 &a, const Vec3 &b) { return lengthSquared(a - b); }
    inline Vec3 normalize(const Vec3 &v)
    {
        float len = length(v);
        if (len <= 0.0f)
            return {0.0f, 0.0f, 0.0f};
        return v / len;
    }

    inline float lerp(float a, float b, float t) { return a + (b - a) * t; }
    inline Vec3 lerp(const Vec3 &a, const Vec3 &b, float t) { return a + (b - a) * t; }

    // Column-major 4x4 matrix (graphics standard). m[col*4 + row]
    struct Mat4
    {
        std::array<float, 16> m{1, 0, 0, 0,
                                0, 1, 0, 0,
                                0, 0, 1, 0,
                                0, 0, 0, 1};
    };

    inline Mat4 identity() { return Mat4{}; }

    inline Mat4 multiply(const Mat4 &a, const Mat4 &b)
    {
        Mat4 r;
        for (int c = 0; c < 4; ++c)
        {
            for (int rIdx = 0; rIdx < 4; ++rIdx)
            {
                r.m[c * 4 + rIdx] = a.m[0 * 4 + rIdx] * b.m[c * 4 + 0] + a.m[1 * 4 + rIdx] * b.m[c * 4 + 1] + a.m[2 * 4 + rIdx] * b.m[c * 4 + 2] + a.m[3 * 4 + rIdx] * b.m[c * 4 + 3];
            }
        }
        return r;
    }

    inline Mat4 transpose(const Mat4 &a)
    {
        Mat4 r;
        for (int c = 0; c < 4; ++c)
            for (int rIdx = 0; rIdx < 4; ++rIdx)
                r.m[c * 4 + rIdx] = a.m[rIdx * 4 + c];
        return r;
    }

    inline Vec3 transformPoint(const Mat4 &a, const Vec3 &p)
    {
        return {a.m[0] * p.x + a.m[4] * p.y + a.m[8] * p.z + a.m[12],
                a.m[1] * p.x + a.m[5] * p.y + a.m[9] * p.z + a.m[13],
                a.m[2] * p.x + a.m[6] * p.y + a.m[10] * p.z + a.m[14]};
    }

    // Ignores translation
    inline Vec3 transformDirection(const Mat4 &a, const Vec3 &d)
    {
        return {a.m[0] * d.x + a.m[4] * d.y + a.m[8] * d.z,
                a.m[1] * d.x + a.m[5] * d.y + a.m[9] * d.z,
                a.m[2] * d.x + a.m[6] * d.y + a.m[10] * d.z};
    }

    inline Mat4 translate(const Vec3 &t)
    {
        Mat4 r = identity();
        r.m[12] = t.x; // 3rd column, row 0
        r.m[13] = t.y; // row 1
        r.m[14] = t.z; // row 2
        return r;
    }

    inline Mat4 scale(const Vec3 &s)
    {
        Mat4 r{};
        r.m = {s.x, 0, 0, 0,
               0, s.y, 0, 0,
               0, 0, s.z, 0,
               0, 0, 0, 1};
        return r;
    }

    inline Mat4 rotateX(float rad)
    {
        float c = std::cos(rad), s = std::sin(rad);
        Mat4 r{};
        r.m = {1, 0, 0, 0,
               0, c, s, 0,
               0, -s, c, 0,
               0, 0, 0, 1};
        return r;
    }

    inline Mat4 rotateY(float rad)
    {
        float c = std::cos(rad), s = std::sin(rad);
        Mat4 r{};
        r.m = {c, 0, -s, 0,
               0, 1, 0, 0,
               s, 0, c, 0,
               0, 0, 0, 1};
        return r;
    }

    inline Mat4 rotateZ(float rad)
    {
        float c = std::cos(rad), s = std::sin(rad);
        Mat4 r{};
        r.m = {c, s, 0, 0,
               -s, c, 0, 0,
               0, 0, 1, 0,
               0, 0, 0, 1};
        return r;
    }

    inline Mat4 eulerXYZ(const Vec3 &rad)
    {
        return multiply(multiply(rotateX(rad.x), rotateY(rad.y)), rotateZ(rad.z));
    }

    inline Mat4 composeTRS(const Vec3 &t, const Vec3 &radEuler, const Vec3 &s)
    {
        return multiply(multiply(translate(t), eulerXYZ(radEuler)), scale(s));
    }

    // Inverse of composeTRS; scale components must be non-zero
    inline Mat4 inverseTRS(const Vec3 &t, const Vec3 &radEuler, const Vec3 &s)
    {
        const Vec3 inv{1.0f / s.x, 1.0f / s.y, 1.0f / s.z};
        return multiply(multiply(scale(inv), transpose(eulerXYZ(radEuler))), translate(-t));
    }

    // Euler angles (XYZ order, as consumed by eulerXYZ) that rotate local +Z onto dir.
    // Roll about the aligned axis is left at zero.
    inline Vec3 eulerAligningZTo(const Vec3 &dir)
    {
        Vec3 d = normalize(dir);
        if (lengthSquared(d) <= 0.0f)
            return {0.0f, 0.0f, 0.0f};
        float pitch = std::atan2(-d.y, d.z);
        float yaw = std::asin(std::clamp(d.x, -1.0f, 1.0f));
        return {pitch, yaw, 0.0f};
    }

} // namespace Engine::Math
