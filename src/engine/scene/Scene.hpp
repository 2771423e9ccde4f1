#pragma once

#include <algorithm>
#include <memory>
#include <vector>
#include "../ecs/Components.hpp"

namespace Engine::Scene
{
    using Engine::ECS::Camera;
    using Engine::ECS::Material;
    using Engine::ECS::MeshData;
    using Engine::ECS::PointCloud;
    using Engine::ECS::RenderStyle;
    using Engine::ECS::Transform;

    // Mesh and material are owned by the enclosing RenderGroup
    struct RenderableEntity
    {
        Transform transform;
        const MeshData *mesh{nullptr};
        Material *material{nullptr};
        RenderStyle style{RenderStyle::Solid};
    };

    // A self-contained batch of geometry that is added to and removed from the scene
    // as a unit. The group's transform is applied on top of every renderable's own.
    struct RenderGroup
    {
        Transform transform;
        std::vector<std::unique_ptr<MeshData>> meshes;
        std::vector<std::unique_ptr<Material>> materials;
        std::vector<RenderableEntity> renderables;
        PointCloud points;
        bool released{false};

        MeshData *addMesh(MeshData mesh)
        {
            meshes.push_back(std::make_unique<MeshData>(std::move(mesh)));
            return meshes.back().get();
        }

        Material *addMaterial(const Material &material)
        {
            materials.push_back(std::make_unique<Material>(material));
            return materials.back().get();
        }

        void setUniformScale(float s) { transform.scale = {s, s, s}; }
        float uniformScale() const { return transform.scale.x; }

        bool empty() const { return renderables.empty() && points.points.empty(); }
        bool isReleased() const { return released; }

        // Drops every owned buffer; the renderer treats this as the GPU release point
        void releaseResources()
        {
            renderables.clear();
            meshes.clear();
            materials.clear();
            points.points.clear();
            points.points.shrink_to_fit();
            released = true;
        }
    };

    struct SceneData
    {
        Transform cameraTransform;
        Camera camera;

        std::vector<std::shared_ptr<RenderGroup>> groups;

        bool contains(const RenderGroup *group) const
        {
            return std::any_of(groups.begin(), groups.end(),
                               [group](const std::shared_ptr<RenderGroup> &g)
                               { return g.get() == group; });
        }

        void add(std::shared_ptr<RenderGroup> group)
        {
            if (!group || contains(group.get()))
                return;
            groups.push_back(std::move(group));
        }

        bool remove(const RenderGroup *group)
        {
            auto it = std::find_if(groups.begin(), groups.end(),
                                   [group](const std::shared_ptr<RenderGroup> &g)
                                   { return g.get() == group; });
            if (it == groups.end())
                return false;
            groups.erase(it);
            return true;
        }
    };

} // namespace Engine::Scene
