// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "engine/math/Ray.hpp"
#include "engine/scene/Scene.hpp"
#include "molxr/ui/command.hpp"

namespace molxr::ui
{
    constexpr float kDefaultMenuRadius = 0.5f;
    constexpr float kInnerRadiusFraction = 0.7f;
    constexpr float kDefaultStickDeadZone = 0.2f;
    constexpr std::uint32_t kWedgeBaseColor = 0x2266aa;
    constexpr std::uint32_t kWedgeHighlightColor = 0xffaa00;

    // Ring of N equal wedges in the menu's local XY plane. Wedge i spans
    // [i * 2pi/N, (i + 1) * 2pi/N) measured from local +X.
    class RadialMenu
    {
    public:
        explicit RadialMenu(std::vector<MenuItem> items, float radius = kDefaultMenuRadius);

        // Scene node holding one renderable per wedge; the menu's pose is this group's transform
        const std::shared_ptr<Engine::Scene::RenderGroup> &group() const { return m_group; }
        Engine::ECS::Transform &transform() { return m_group->transform; }
        const Engine::ECS::Transform &transform() const { return m_group->transform; }

        std::size_t itemCount() const { return m_items.size(); }
        const MenuItem &item(std::size_t index) const { return m_items.at(index); }
        float radius() const { return m_radius; }

        bool visible() const { return m_visible; }
        void setVisible(bool visible);

        int hovered() const { return m_hover; }
        void setHover(int index);

        // Nearest wedge hit along a world-space ray becomes the hover; no hit clears it
        int handlePointer(const Engine::Math::Ray &worldRay);

        // Distance along the ray to the nearest wedge, if any
        std::optional<float> intersect(const Engine::Math::Ray &worldRay, int *wedgeIndex = nullptr) const;

        int hoverFromStick(float x, float y, float deadZone = kDefaultStickDeadZone);

        // Stick up is angle 0, increasing clockwise. -1 inside the dead zone.
        static int stickToIndex(float x, float y, std::size_t count, float deadZone = kDefaultStickDeadZone);

        // Runs the hovered item's action. False when nothing is hovered.
        bool select();

        bool setAction(std::string_view label, std::shared_ptr<Command> action);

        void setOpacity(float opacity);
        float opacity() const { return m_opacity; }

        // Orient the menu so its front face points at `viewer`
        void faceTowards(const Engine::Math::Vec3 &viewer);

        std::uint32_t wedgeColor(std::size_t index) const;

    private:
        void paintWedge(int index, std::uint32_t hex);

        std::vector<MenuItem> m_items;
        float m_radius;
        std::shared_ptr<Engine::Scene::RenderGroup> m_group;
        std::vector<Engine::ECS::Material *> m_wedgeMaterials;
        int m_hover{-1};
        float m_opacity{1.0f};
        bool m_visible{true};
    };

} // namespace molxr::ui
