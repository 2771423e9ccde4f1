// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <vector>

#include "molxr/ui/radial_menu.hpp"

namespace molxr::ui
{
    constexpr float kContextMenuRadius = 0.25f;

    // Short-lived wedge menu spawned at a point in the world. Its items cannot be
    // changed after construction; it is used once and then discarded.
    class ContextMenu
    {
    public:
        ContextMenu(std::vector<MenuItem> items, const Engine::Math::Vec3 &worldPoint,
                    const Engine::Math::Vec3 &viewerPosition, float radius = kContextMenuRadius);

        const std::shared_ptr<Engine::Scene::RenderGroup> &group() const { return m_menu.group(); }
        const Engine::ECS::Transform &transform() const { return m_menu.transform(); }

        std::size_t itemCount() const { return m_menu.itemCount(); }
        const MenuItem &item(std::size_t index) const { return m_menu.item(index); }
        int hovered() const { return m_menu.hovered(); }
        std::uint32_t wedgeColor(std::size_t index) const { return m_menu.wedgeColor(index); }

        int handlePointer(const Engine::Math::Ray &worldRay);
        int hoverFromStick(float x, float y, float deadZone = kDefaultStickDeadZone);

        // Runs the hovered action, if any, and marks the menu discarded.
        // Returns whether an action ran. Later calls do nothing.
        bool release();

        bool discarded() const { return m_discarded; }

    private:
        RadialMenu m_menu;
        bool m_discarded{false};
    };

} // namespace molxr::ui
