#pragma once

#include <cmath>
#include "../math/Mat4.hpp"
#include "../math/Ray.hpp"
#include "../ecs/Components.hpp"

namespace Engine::Render
{
    using Engine::Math::Ray;
    using Engine::Math::Vec3;

    // Pointer ray through a point given in normalized device coordinates ([-1, 1], +Y up)
    inline Ray ScreenPointToRay(const Engine::ECS::Transform &camXform, const Engine::ECS::Camera &cam, float ndcX, float ndcY)
    {
        const float tanHalf = std::tan(cam.fovYRadians * 0.5f);
        const Vec3 dirCamera{ndcX * tanHalf * cam.aspect, ndcY * tanHalf, -1.0f};
        const Vec3 dirWorld = Engine::Math::transformDirection(Engine::Math::eulerXYZ(camXform.rotationEulerRad), dirCamera);
        return Ray{camXform.position, Engine::Math::normalize(dirWorld)};
    }
} // namespace Engine::Render
