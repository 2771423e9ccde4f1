// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/app/overlay.hpp"

#include "imgui.h"

#include "molxr/repr/representation.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace molxr::app
{

    namespace
    {
        ImU32 ToImColor(std::uint32_t hex, float alpha = 1.0f)
        {
            return IM_COL32((hex >> 16) & 0xff, (hex >> 8) & 0xff, hex & 0xff, static_cast<int>(alpha * 255.0f));
        }

        void RenderTextPanel(const ui::TextPanel &panel)
        {
            for (const auto &line : panel.lines())
                ImGui::TextUnformatted(line.c_str());
        }

        void RenderQuickLoadPanel(ui::QuickLoadPanel &panel)
        {
            const auto &ids = panel.ids();
            for (std::size_t i = 0; i < ids.size(); ++i)
            {
                const bool hovered = panel.hovered() == static_cast<int>(i);
                if (ImGui::Selectable(ids[i].c_str(), hovered))
                    panel.choose(i);
            }
        }

        void RenderStructureInputPanel(ui::StructureInputPanel &panel)
        {
            ImGui::Text("ID: %s", panel.displayText().c_str());
            ImGui::Separator();

            const auto &keys = panel.keys();
            float rowY = keys.empty() ? 0.0f : keys.front().rect.center.y;
            std::string pressed;
            for (std::size_t i = 0; i < keys.size(); ++i)
            {
                // Keys sharing a row in panel space share a line here
                if (i > 0 && keys[i].rect.center.y == rowY)
                    ImGui::SameLine();
                rowY = keys[i].rect.center.y;

                ImGui::PushID(static_cast<int>(i));
                if (ImGui::Button(keys[i].label.c_str()))
                    pressed = keys[i].label;
                ImGui::PopID();
            }
            // Applied after the loop: Load may hide the panel
            if (!pressed.empty())
                panel.pressKey(pressed);
        }
    }

    void RenderOverlay(ViewerController &viewer)
    {
        RenderStatusWindow(viewer);
        RenderWristMenu(viewer);
        RenderVisiblePanel(viewer);
    }

    void RenderStatusWindow(const ViewerController &viewer)
    {
        ImGui::Begin("Viewer");
        if (const auto *mol = viewer.molecule())
        {
            ImGui::Text("Structure: %s", mol->sourceId.c_str());
            ImGui::Text("Atoms: %zu", mol->atoms.size());
            ImGui::Text("Style: %s", std::string(repr::to_string(mol->activeKind)).c_str());
            ImGui::Text("Scale: %.3f", mol->uniformScale);
        }
        else
        {
            ImGui::TextUnformatted("No structure loaded");
        }
        if (viewer.loading())
            ImGui::TextUnformatted("Loading...");
        if (viewer.state().transition.active())
            ImGui::ProgressBar(viewer.state().transition.elapsed() / viewer.state().transition.duration());
        ImGui::End();
    }

    void RenderWristMenu(ViewerController &viewer)
    {
        auto &menu = viewer.wristMenu();
        if (!menu.visible() || menu.itemCount() == 0)
            return;

        ImGui::Begin("Menu");
        ImDrawList *dl = ImGui::GetWindowDrawList();
        const ImVec2 origin = ImGui::GetCursorScreenPos();
        const float outer = 80.0f;
        const float inner = outer * ui::kInnerRadiusFraction;
        const ImVec2 center(origin.x + outer + 4.0f, origin.y + outer + 4.0f);
        const float arc = Engine::Math::kTwoPi / static_cast<float>(menu.itemCount());

        for (std::size_t i = 0; i < menu.itemCount(); ++i)
        {
            // Screen Y grows downwards, so wedge angles are negated to keep the menu's orientation
            const float a0 = -static_cast<float>(i) * arc;
            const float a1 = a0 - arc;
            dl->PathArcTo(center, (outer + inner) * 0.5f, a0, a1, 16);
            dl->PathStroke(ToImColor(menu.wedgeColor(i), menu.opacity()), 0, outer - inner - 2.0f);

            const float mid = (a0 + a1) * 0.5f;
            const ImVec2 labelPos(center.x + std::cos(mid) * (outer + inner) * 0.5f - 16.0f,
                                  center.y + std::sin(mid) * (outer + inner) * 0.5f - 6.0f);
            dl->AddText(labelPos, IM_COL32_WHITE, menu.item(i).label.c_str());
        }
        ImGui::Dummy(ImVec2(outer * 2.0f + 8.0f, outer * 2.0f + 8.0f));

        for (std::size_t i = 0; i < menu.itemCount(); ++i)
        {
            const bool hovered = menu.hovered() == static_cast<int>(i);
            if (ImGui::Selectable(menu.item(i).label.c_str(), hovered))
            {
                menu.setHover(static_cast<int>(i));
                menu.select();
            }
        }
        ImGui::End();
    }

    void RenderVisiblePanel(ViewerController &viewer)
    {
        auto &panels = viewer.panels();
        auto id = panels.visibleId();
        if (!id)
            return;

        auto &panel = panels.panel(*id);
        bool open = true;
        ImGui::Begin(panel.title().c_str(), &open);
        switch (*id)
        {
        case ui::PanelId::QuickLoad:
            RenderQuickLoadPanel(panels.quickLoadPanel());
            break;
        case ui::PanelId::StructureInput:
            RenderStructureInputPanel(panels.structureInputPanel());
            break;
        default:
            RenderTextPanel(static_cast<const ui::TextPanel &>(panel));
            break;
        }
        ImGui::End();

        if (!open)
            viewer.closePanels();
    }

} // namespace molxr::app
