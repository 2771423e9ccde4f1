// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/ui/panel_manager.hpp"

#include <spdlog/spdlog.h>

namespace molxr::ui
{

    std::vector<std::string> default_quick_load_ids()
    {
        return {"1CRN", "2POR", "5PTI", "4HHB", "1A4W"};
    }

    PanelManager::PanelManager(std::vector<std::string> quickLoadIds, float distance)
        : m_distance(distance)
    {
        m_help = std::make_unique<TextPanel>(PanelId::Help, "Help", std::vector<std::string>{
            "Molecule Viewer",
            "",
            "Left controller:",
            "  Thumbstick   highlight wrist menu",
            "  Grip         show/hide wrist menu",
            "",
            "Right controller:",
            "  Trigger tap  select",
            "  Trigger hold context menu",
            "",
            "Wrist menu: Help, Settings, Load, Visuals, Enter ID",
        });
        m_settings = std::make_unique<TextPanel>(PanelId::Settings, "Settings", std::vector<std::string>{
            "Settings",
            "",
            "Configuration is read from config/viewer.json",
            "  sync.port, fetch.baseUrl, ui.panelDistance",
            "  ui.stickDeadZone, ui.longPressSeconds",
        });
        m_visuals = std::make_unique<TextPanel>(PanelId::Visuals, "Visual Styles", std::vector<std::string>{
            "Visual Styles",
            "",
            "1  Ball and Stick",
            "2  Space Fill",
            "3  Wireframe",
            "4  Transparent Surface",
            "5  Ribbon",
            "",
            "Select Visuals on the menu to cycle",
        });
        m_quickLoad = std::make_unique<QuickLoadPanel>(std::move(quickLoadIds));
        m_structureInput = std::make_unique<StructureInputPanel>();

        m_all = {m_help.get(), m_settings.get(), m_visuals.get(), m_quickLoad.get(), m_structureInput.get()};
    }

    bool PanelManager::toggle(PanelId id)
    {
        Panel &target = panel(id);
        const bool willOpen = !target.visible();
        hideAll();
        if (willOpen)
        {
            place(target);
            target.show();
            spdlog::debug("[Panels] Opened {}", to_string(id));
        }
        return willOpen;
    }

    void PanelManager::hideAll()
    {
        for (auto *p : m_all)
            p->hide();
    }

    void PanelManager::update(const Engine::Math::Vec3 &viewerPosition, const Engine::Math::Vec3 &viewerForward)
    {
        m_viewerPosition = viewerPosition;
        if (Engine::Math::lengthSquared(viewerForward) > 0.0f)
            m_viewerForward = Engine::Math::normalize(viewerForward);
        if (auto *p = visiblePanel())
            place(*p);
    }

    void PanelManager::handlePointer(const Engine::Math::Ray &worldRay)
    {
        if (auto *p = visiblePanel())
            p->handlePointer(worldRay);
    }

    bool PanelManager::select()
    {
        if (auto *p = visiblePanel())
            return p->select();
        return false;
    }

    std::optional<PanelId> PanelManager::visibleId() const
    {
        for (const auto *p : m_all)
        {
            if (p->visible())
                return p->id();
        }
        return std::nullopt;
    }

    Panel &PanelManager::panel(PanelId id)
    {
        return *m_all.at(static_cast<std::size_t>(id));
    }

    const Panel &PanelManager::panel(PanelId id) const
    {
        return *m_all.at(static_cast<std::size_t>(id));
    }

    void PanelManager::place(Panel &panel)
    {
        auto &t = panel.transform();
        t.position = m_viewerPosition + m_viewerForward * m_distance;
        t.rotationEulerRad = Engine::Math::eulerAligningZTo(m_viewerPosition - t.position);
    }

    Panel *PanelManager::visiblePanel()
    {
        for (auto *p : m_all)
        {
            if (p->visible())
                return p;
        }
        return nullptr;
    }

} // namespace molxr::ui
