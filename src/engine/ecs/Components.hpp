#pragma once

#include <cstdint>
#include <vector>
#include "../math/Mat4.hpp"

namespace Engine::ECS
{
    using Engine::Math::Mat4;
    using Engine::Math::Vec3;

    struct Transform
    {
        Vec3 position{0, 0, 0};
        Vec3 rotationEulerRad{0, 0, 0};
        Vec3 scale{1, 1, 1};

        Mat4 localMatrix() const { return Engine::Math::composeTRS(position, rotationEulerRad, scale); }
        Mat4 inverseMatrix() const { return Engine::Math::inverseTRS(position, rotationEulerRad, scale); }
    };

    struct Camera
    {
        float fovYRadians{60.0f * 3.1415926535f / 180.0f};
        float aspect{16.0f / 9.0f};
        float nearPlane{0.1f};
        float farPlane{1000.0f};
    };

    struct VertexPC
    {
        float px, py, pz; // position
        float cr, cg, cb; // color
    };

    struct MeshData
    {
        // Immutable geometry buffers (CPU-side for now)
        std::vector<VertexPC> vertices;
        std::vector<std::uint32_t> indices;

        std::size_t triangleCount() const { return indices.size() / 3; }
    };

    enum class RenderStyle : std::uint8_t
    {
        Solid,
        Wireframe,
        Points,
        Hidden
    };

    struct Material
    {
        // Simple solid color material for CPU renderer
        float r{1.0f};
        float g{1.0f};
        float b{1.0f};
        bool useVertexColor{true}; // if false, use r/g/b for fill
        bool transparent{false};
        float opacity{1.0f};
        bool doubleSided{false};
    };

    inline void SetMaterialColor(Material &mat, std::uint32_t rgbHex)
    {
        mat.r = static_cast<float>((rgbHex >> 16) & 0xffu) / 255.0f;
        mat.g = static_cast<float>((rgbHex >> 8) & 0xffu) / 255.0f;
        mat.b = static_cast<float>(rgbHex & 0xffu) / 255.0f;
        mat.useVertexColor = false;
    }

    inline Material SolidMaterial(std::uint32_t rgbHex)
    {
        Material mat;
        SetMaterialColor(mat, rgbHex);
        return mat;
    }

    // Packs r/g/b back to 0xRRGGBB (rounded), mainly for inspection and tests
    inline std::uint32_t MaterialColorHex(const Material &mat)
    {
        auto channel = [](float v) -> std::uint32_t
        {
            if (v < 0.0f)
                v = 0.0f;
            if (v > 1.0f)
                v = 1.0f;
            return static_cast<std::uint32_t>(v * 255.0f + 0.5f);
        };
        return (channel(mat.r) << 16) | (channel(mat.g) << 8) | channel(mat.b);
    }

    // GPU point sprites; one vertex per point, colored per vertex
    struct PointCloud
    {
        std::vector<VertexPC> points;
        float pointSize{0.15f};
    };

} // namespace Engine::ECS
