// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/ui/context_menu.hpp"

namespace molxr::ui
{

    ContextMenu::ContextMenu(std::vector<MenuItem> items, const Engine::Math::Vec3 &worldPoint,
                             const Engine::Math::Vec3 &viewerPosition, float radius)
        : m_menu(std::move(items), radius)
    {
        m_menu.transform().position = worldPoint;
        m_menu.faceTowards(viewerPosition);
    }

    int ContextMenu::handlePointer(const Engine::Math::Ray &worldRay)
    {
        if (m_discarded)
            return -1;
        return m_menu.handlePointer(worldRay);
    }

    int ContextMenu::hoverFromStick(float x, float y, float deadZone)
    {
        if (m_discarded)
            return -1;
        return m_menu.hoverFromStick(x, y, deadZone);
    }

    bool ContextMenu::release()
    {
        if (m_discarded)
            return false;
        m_discarded = true;
        const bool ran = m_menu.select();
        m_menu.setVisible(false);
        return ran;
    }

} // namespace molxr::ui
