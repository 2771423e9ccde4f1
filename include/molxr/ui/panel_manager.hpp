// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "molxr/ui/panels.hpp"

namespace molxr::ui
{
    constexpr float kDefaultPanelDistance = 1.0f;

    std::vector<std::string> default_quick_load_ids();

    // Owns every panel and keeps at most one of them visible
    class PanelManager
    {
    public:
        explicit PanelManager(std::vector<std::string> quickLoadIds = default_quick_load_ids(),
                              float distance = kDefaultPanelDistance);

        // Hides everything, then opens `id` unless it was the panel already showing.
        // Returns whether `id` is now open.
        bool toggle(PanelId id);
        void hideAll();

        // Keeps the visible panel `distance` metres along the viewer's forward axis, facing the viewer
        void update(const Engine::Math::Vec3 &viewerPosition, const Engine::Math::Vec3 &viewerForward);

        void handlePointer(const Engine::Math::Ray &worldRay);
        bool select();

        std::optional<PanelId> visibleId() const;
        bool anyVisible() const { return visibleId().has_value(); }

        Panel &panel(PanelId id);
        const Panel &panel(PanelId id) const;
        TextPanel &visualsPanel() { return *m_visuals; }
        QuickLoadPanel &quickLoadPanel() { return *m_quickLoad; }
        StructureInputPanel &structureInputPanel() { return *m_structureInput; }

        float distance() const { return m_distance; }
        void setDistance(float metres) { m_distance = metres; }

    private:
        void place(Panel &panel);
        Panel *visiblePanel();

        std::unique_ptr<TextPanel> m_help;
        std::unique_ptr<TextPanel> m_settings;
        std::unique_ptr<TextPanel> m_visuals;
        std::unique_ptr<QuickLoadPanel> m_quickLoad;
        std::unique_ptr<StructureInputPanel> m_structureInput;
        std::array<Panel *, 5> m_all{};

        float m_distance;
        Engine::Math::Vec3 m_viewerPosition{0.0f, 1.6f, 3.0f};
        Engine::Math::Vec3 m_viewerForward{0.0f, 0.0f, -1.0f};
    };

} // namespace molxr::ui
