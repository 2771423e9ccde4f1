// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/ecs/Components.hpp"
#include "engine/math/Ray.hpp"

namespace molxr::ui
{
    using Engine::Math::Vec2;

    enum class PanelId : std::uint8_t
    {
        Help,
        Settings,
        Visuals,
        QuickLoad,
        StructureInput
    };

    std::string_view to_string(PanelId id);

    // Axis-aligned rectangle in a panel's local XY plane
    struct PanelRect
    {
        Vec2 center;
        Vec2 halfSize;

        bool contains(const Vec2 &p) const
        {
            return p.x >= center.x - halfSize.x && p.x <= center.x + halfSize.x &&
                   p.y >= center.y - halfSize.y && p.y <= center.y + halfSize.y;
        }
    };

    // Flat rectangular panel centered on its transform, front face towards local +Z.
    // Every panel carries a close button in its top-right corner.
    class Panel
    {
    public:
        static constexpr float kCloseButtonSize = 0.12f;
        static constexpr float kCloseButtonMargin = 0.05f;

        Panel(PanelId id, std::string title, float width, float height);
        virtual ~Panel() = default;

        PanelId id() const { return m_id; }
        const std::string &title() const { return m_title; }
        float width() const { return m_width; }
        float height() const { return m_height; }

        Engine::ECS::Transform &transform() { return m_transform; }
        const Engine::ECS::Transform &transform() const { return m_transform; }

        bool visible() const { return m_visible; }
        void show() { m_visible = true; }
        void hide();

        // Hit point on the panel face in local coordinates, if the ray strikes it
        std::optional<Vec2> localHit(const Engine::Math::Ray &worldRay) const;

        void handlePointer(const Engine::Math::Ray &worldRay);

        // Click on the panel. Returns true if the panel consumed it.
        virtual bool select();

        bool closeHovered() const { return m_closeHovered; }
        PanelRect closeButton() const;

    protected:
        // Called with the local hit (or nothing) after the close button hover is updated
        virtual void hoverAt(const std::optional<Vec2> &local) { (void)local; }

    private:
        PanelId m_id;
        std::string m_title;
        float m_width;
        float m_height;
        Engine::ECS::Transform m_transform;
        bool m_visible{false};
        bool m_closeHovered{false};
    };

    class TextPanel : public Panel
    {
    public:
        TextPanel(PanelId id, std::string title, std::vector<std::string> lines,
                  float width = 1.2f, float height = 0.7f);

        const std::vector<std::string> &lines() const { return m_lines; }
        void setLines(std::vector<std::string> lines) { m_lines = std::move(lines); }

    private:
        std::vector<std::string> m_lines;
    };

    // One button per structure id, stacked top to bottom
    class QuickLoadPanel : public Panel
    {
    public:
        using SelectHandler = std::function<void(const std::string &)>;

        static constexpr float kRowHeight = 0.12f;

        explicit QuickLoadPanel(std::vector<std::string> ids, float width = 0.8f);

        const std::vector<std::string> &ids() const { return m_ids; }
        int hovered() const { return m_hover; }
        PanelRect row(std::size_t index) const;

        void setOnSelect(SelectHandler handler) { m_onSelect = std::move(handler); }

        // Fires the select handler for row `index` directly (button front ends)
        void choose(std::size_t index);

        // Close button first; then the hovered row fires the handler; clicking
        // with nothing hovered closes the panel.
        bool select() override;

    protected:
        void hoverAt(const std::optional<Vec2> &local) override;

    private:
        std::vector<std::string> m_ids;
        int m_hover{-1};
        SelectHandler m_onSelect;
    };

    // On-screen keyboard for typing a four-character structure id
    class StructureInputPanel : public Panel
    {
    public:
        using LoadHandler = std::function<void(const std::string &)>;

        static constexpr float kKeySize = 0.12f;
        static constexpr std::size_t kMaxLength = 4;
        static constexpr std::string_view kBackspace = "Backspace";
        static constexpr std::string_view kLoad = "Load";

        explicit StructureInputPanel(float width = 1.3f);

        struct Key
        {
            std::string label;
            PanelRect rect;
        };

        const std::vector<Key> &keys() const { return m_keys; }
        int hovered() const { return m_hover; }
        const std::string &text() const { return m_text; }
        // Current text padded with '-' to the full id length
        std::string displayText() const;

        void setOnLoad(LoadHandler handler) { m_onLoad = std::move(handler); }

        // Applies one key: a character, kBackspace or kLoad. Unknown labels are ignored.
        void pressKey(std::string_view label);

        bool select() override;

    protected:
        void hoverAt(const std::optional<Vec2> &local) override;

    private:
        std::vector<Key> m_keys;
        int m_hover{-1};
        std::string m_text;
        LoadHandler m_onLoad;
    };

} // namespace molxr::ui
