#pragma once

#include <vector>
#include <cmath>
#include "../ecs/Components.hpp"
#include "Curve.hpp"

namespace Engine::Gfx
{
    using Engine::ECS::MeshData;
    using Engine::ECS::VertexPC;

    // UV sphere centered at origin, poles on the Y axis
    inline MeshData CreateSphere(float radius, int widthSegments = 16, int heightSegments = 12)
    {
        MeshData m;
        if (widthSegments < 3)
            widthSegments = 3;
        if (heightSegments < 2)
            heightSegments = 2;

        const int cols = widthSegments + 1;
        const int rows = heightSegments + 1;
        m.vertices.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols));
        m.indices.reserve(static_cast<size_t>(widthSegments) * static_cast<size_t>(heightSegments) * 6);

        for (int iy = 0; iy < rows; ++iy)
        {
            float v = static_cast<float>(iy) / static_cast<float>(heightSegments);
            float theta = v * 3.1415926535f;
            for (int ix = 0; ix < cols; ++ix)
            {
                float u = static_cast<float>(ix) / static_cast<float>(widthSegments);
                float phi = u * 2.0f * 3.1415926535f;
                float x = -radius * std::cos(phi) * std::sin(theta);
                float y = radius * std::cos(theta);
                float z = radius * std::sin(phi) * std::sin(theta);
                m.vertices.push_back(VertexPC{x, y, z, 0.7f, 0.7f, 0.72f});
            }
        }

        auto idx = [&](int r, int c) -> std::uint32_t
        { return static_cast<std::uint32_t>(r * cols + c); };
        for (int iy = 0; iy < heightSegments; ++iy)
        {
            for (int ix = 0; ix < widthSegments; ++ix)
            {
                std::uint32_t a = idx(iy, ix + 1);
                std::uint32_t b = idx(iy, ix);
                std::uint32_t c = idx(iy + 1, ix);
                std::uint32_t d = idx(iy + 1, ix + 1);
                // Pole rows collapse to a single triangle per quad
                if (iy != 0)
                {
                    m.indices.push_back(a);
                    m.indices.push_back(b);
                    m.indices.push_back(d);
                }
                if (iy != heightSegments - 1)
                {
                    m.indices.push_back(b);
                    m.indices.push_back(c);
                    m.indices.push_back(d);
                }
            }
        }
        return m;
    }

    // Cylinder aligned along Z axis, centered at origin
    inline MeshData CreateCylinder(float radius, float length, int slices = 16, bool capped = true)
    {
        MeshData m;
        if (slices < 3)
            slices = 3;
        const float half = length * 0.5f;

        // Build side vertices: two rows (bottom z=-half, top z=+half), duplicate last column for seam
        const int rows = 2;
        const int cols = slices + 1;
        m.vertices.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols) + (capped ? 2 : 0));
        m.indices.reserve(static_cast<size_t>(slices) * 6 + (capped ? static_cast<size_t>(slices) * 6 : 0));

        auto ringZ = [&](int r)
        { return (r == 0) ? -half : +half; };
        for (int r = 0; r < rows; ++r)
        {
            float z = ringZ(r);
            for (int j = 0; j < cols; ++j)
            {
                float u = static_cast<float>(j) / static_cast<float>(slices);
                float phi = u * 2.0f * 3.1415926535f;
                float x = radius * std::cos(phi);
                float y = radius * std::sin(phi);
                m.vertices.push_back(VertexPC{x, y, z, 0.87f, 0.87f, 0.87f});
            }
        }

        auto idx = [&](int r, int c) -> std::uint32_t
        { return static_cast<std::uint32_t>(r * cols + c); };
        for (int j = 0; j < slices; ++j)
        {
            std::uint32_t i0 = idx(0, j);
            std::uint32_t i1 = idx(0, j + 1);
            std::uint32_t i2 = idx(1, j);
            std::uint32_t i3 = idx(1, j + 1);
            // Two triangles per quad (match winding with sphere function)
            m.indices.push_back(i0);
            m.indices.push_back(i2);
            m.indices.push_back(i1);
            m.indices.push_back(i1);
            m.indices.push_back(i2);
            m.indices.push_back(i3);
        }

        if (capped)
        {
            std::uint32_t bottomCenter = static_cast<std::uint32_t>(m.vertices.size());
            m.vertices.push_back(VertexPC{0.0f, 0.0f, -half, 0.87f, 0.87f, 0.87f});
            std::uint32_t topCenter = static_cast<std::uint32_t>(m.vertices.size());
            m.vertices.push_back(VertexPC{0.0f, 0.0f, +half, 0.87f, 0.87f, 0.87f});

            for (int j = 0; j < slices; ++j)
            {
                std::uint32_t b0 = idx(0, j);
                std::uint32_t b1 = idx(0, j + 1);
                m.indices.push_back(bottomCenter);
                m.indices.push_back(b1);
                m.indices.push_back(b0);

                std::uint32_t t0 = idx(1, j);
                std::uint32_t t1 = idx(1, j + 1);
                m.indices.push_back(topCenter);
                m.indices.push_back(t0);
                m.indices.push_back(t1);
            }
        }

        return m;
    }

    // Flat annulus sector in the XY plane. Angles are measured from +X towards +Y.
    inline MeshData CreateRingSector(float innerRadius, float outerRadius, int thetaSegments,
                                     float thetaStart, float thetaLength)
    {
        MeshData m;
        if (thetaSegments < 1)
            thetaSegments = 1;
        const int cols = thetaSegments + 1;
        m.vertices.reserve(static_cast<size_t>(cols) * 2);
        m.indices.reserve(static_cast<size_t>(thetaSegments) * 6);

        for (int ring = 0; ring < 2; ++ring)
        {
            float r = (ring == 0) ? innerRadius : outerRadius;
            for (int i = 0; i < cols; ++i)
            {
                float a = thetaStart + thetaLength * static_cast<float>(i) / static_cast<float>(thetaSegments);
                m.vertices.push_back(VertexPC{r * std::cos(a), r * std::sin(a), 0.0f, 1.0f, 1.0f, 1.0f});
            }
        }

        for (int i = 0; i < thetaSegments; ++i)
        {
            std::uint32_t a = static_cast<std::uint32_t>(i);
            std::uint32_t b = static_cast<std::uint32_t>(i + cols);
            std::uint32_t c = static_cast<std::uint32_t>(i + cols + 1);
            std::uint32_t d = static_cast<std::uint32_t>(i + 1);
            m.indices.push_back(a);
            m.indices.push_back(b);
            m.indices.push_back(d);
            m.indices.push_back(b);
            m.indices.push_back(c);
            m.indices.push_back(d);
        }
        return m;
    }

    // Fixed-radius tube swept along a curve. Cross-sections are oriented with
    // parallel-transported frames so the tube does not twist at inflection points.
    inline MeshData CreateTube(const CatmullRomCurve &curve, int tubularSegments, float radius, int radialSegments = 8)
    {
        using Engine::Math::cross;
        using Engine::Math::dot;
        using Engine::Math::normalize;
        using Engine::Math::Vec3;

        MeshData m;
        if (curve.controlPointCount() < 2)
            return m;
        if (tubularSegments < 1)
            tubularSegments = 1;
        if (radialSegments < 3)
            radialSegments = 3;

        const int rows = tubularSegments + 1;
        const int cols = radialSegments + 1;
        m.vertices.reserve(static_cast<size_t>(rows) * static_cast<size_t>(cols));
        m.indices.reserve(static_cast<size_t>(tubularSegments) * static_cast<size_t>(radialSegments) * 6);

        // Initial normal: perpendicular to the first tangent, seeded from its smallest axis
        Vec3 prevTangent = curve.tangent(0.0f);
        if (Engine::Math::lengthSquared(prevTangent) <= 0.0f)
            prevTangent = {0.0f, 0.0f, 1.0f};
        Vec3 seed{1.0f, 0.0f, 0.0f};
        {
            float ax = std::fabs(prevTangent.x), ay = std::fabs(prevTangent.y), az = std::fabs(prevTangent.z);
            if (ay <= ax && ay <= az)
                seed = {0.0f, 1.0f, 0.0f};
            else if (az <= ax && az <= ay)
                seed = {0.0f, 0.0f, 1.0f};
        }
        Vec3 normal = normalize(cross(prevTangent, cross(seed, prevTangent)));

        for (int i = 0; i < rows; ++i)
        {
            float t = static_cast<float>(i) / static_cast<float>(tubularSegments);
            Vec3 p = curve.point(t);
            Vec3 tangent = curve.tangent(t);
            if (Engine::Math::lengthSquared(tangent) <= 0.0f)
                tangent = prevTangent;

            // Rotate the running normal by the rotation that carries prevTangent onto tangent
            Vec3 axis = cross(prevTangent, tangent);
            float axisLen = Engine::Math::length(axis);
            if (axisLen > 1e-6f)
            {
                axis = axis / axisLen;
                float c = dot(prevTangent, tangent);
                c = c < -1.0f ? -1.0f : (c > 1.0f ? 1.0f : c);
                float angle = std::acos(c);
                float s = std::sin(angle);
                float k = 1.0f - std::cos(angle);
                // Rodrigues rotation
                normal = normal * std::cos(angle) + cross(axis, normal) * s + axis * (dot(axis, normal) * k);
                normal = normalize(normal);
            }
            Vec3 binormal = normalize(cross(tangent, normal));
            prevTangent = tangent;

            for (int j = 0; j < cols; ++j)
            {
                float v = static_cast<float>(j) / static_cast<float>(radialSegments) * 2.0f * 3.1415926535f;
                float sn = std::sin(v);
                float cs = -std::cos(v);
                Vec3 dir = normal * cs + binormal * sn;
                Vec3 q = p + dir * radius;
                m.vertices.push_back(VertexPC{q.x, q.y, q.z, 1.0f, 1.0f, 1.0f});
            }
        }

        for (int i = 1; i < rows; ++i)
        {
            for (int j = 1; j < cols; ++j)
            {
                std::uint32_t a = static_cast<std::uint32_t>(cols * (i - 1) + (j - 1));
                std::uint32_t b = static_cast<std::uint32_t>(cols * i + (j - 1));
                std::uint32_t c = static_cast<std::uint32_t>(cols * i + j);
                std::uint32_t d = static_cast<std::uint32_t>(cols * (i - 1) + j);
                m.indices.push_back(a);
                m.indices.push_back(b);
                m.indices.push_back(d);
                m.indices.push_back(b);
                m.indices.push_back(c);
                m.indices.push_back(d);
            }
        }
        return m;
    }
}
