// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/ui/panels.hpp"

#include <array>
#include <cctype>

namespace molxr::ui
{

    std::string_view to_string(PanelId id)
    {
        switch (id)
        {
        case PanelId::Help:
            return "Help";
        case PanelId::Settings:
            return "Settings";
        case PanelId::Visuals:
            return "Visuals";
        case PanelId::QuickLoad:
            return "Quick Load";
        case PanelId::StructureInput:
            return "Enter ID";
        default:
            return "Unknown";
        }
    }

    // ---------------------------------------------------------------------
    // Panel

    Panel::Panel(PanelId id, std::string title, float width, float height)
        : m_id(id), m_title(std::move(title)), m_width(width), m_height(height)
    {
    }

    void Panel::hide()
    {
        m_visible = false;
        m_closeHovered = false;
        hoverAt(std::nullopt);
    }

    std::optional<Vec2> Panel::localHit(const Engine::Math::Ray &worldRay) const
    {
        const auto local = Engine::Math::transformRay(m_transform.inverseMatrix(), worldRay);
        auto t = Engine::Math::intersectPlane(local, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f});
        if (!t)
            return std::nullopt;
        const auto p = Engine::Math::pointAt(local, *t);
        const Vec2 hit{p.x, p.y};
        const PanelRect face{{0.0f, 0.0f}, {m_width * 0.5f, m_height * 0.5f}};
        if (!face.contains(hit))
            return std::nullopt;
        return hit;
    }

    void Panel::handlePointer(const Engine::Math::Ray &worldRay)
    {
        if (!m_visible)
            return;
        const auto hit = localHit(worldRay);
        m_closeHovered = hit && closeButton().contains(*hit);
        hoverAt(hit);
    }

    bool Panel::select()
    {
        if (m_closeHovered)
        {
            hide();
            return true;
        }
        return false;
    }

    PanelRect Panel::closeButton() const
    {
        const float half = kCloseButtonSize * 0.5f;
        return PanelRect{{m_width * 0.5f - half - kCloseButtonMargin, m_height * 0.5f - half - kCloseButtonMargin},
                         {half, half}};
    }

    // ---------------------------------------------------------------------
    // TextPanel

    TextPanel::TextPanel(PanelId id, std::string title, std::vector<std::string> lines, float width, float height)
        : Panel(id, std::move(title), width, height), m_lines(std::move(lines))
    {
    }

    // ---------------------------------------------------------------------
    // QuickLoadPanel

    QuickLoadPanel::QuickLoadPanel(std::vector<std::string> ids, float width)
        : Panel(PanelId::QuickLoad, "Quick Load", width, static_cast<float>(ids.size()) * kRowHeight + 0.1f),
          m_ids(std::move(ids))
    {
    }

    PanelRect QuickLoadPanel::row(std::size_t index) const
    {
        const float yStart = (static_cast<float>(m_ids.size()) - 1.0f) * kRowHeight * 0.5f;
        return PanelRect{{0.0f, yStart - static_cast<float>(index) * kRowHeight},
                         {(width() - 0.1f) * 0.5f, (kRowHeight - 0.02f) * 0.5f}};
    }

    void QuickLoadPanel::hoverAt(const std::optional<Vec2> &local)
    {
        m_hover = -1;
        if (!local)
            return;
        for (std::size_t i = 0; i < m_ids.size(); ++i)
        {
            if (row(i).contains(*local))
            {
                m_hover = static_cast<int>(i);
                return;
            }
        }
    }

    bool QuickLoadPanel::select()
    {
        if (Panel::select())
            return true;
        if (m_hover == -1)
        {
            hide();
            return true;
        }
        choose(static_cast<std::size_t>(m_hover));
        return true;
    }

    void QuickLoadPanel::choose(std::size_t index)
    {
        if (index >= m_ids.size())
            return;
        const std::string id = m_ids[index];
        if (m_onSelect)
            m_onSelect(id);
    }

    // ---------------------------------------------------------------------
    // StructureInputPanel

    StructureInputPanel::StructureInputPanel(float width)
        : Panel(PanelId::StructureInput, "Enter ID", width, kKeySize * 6.0f + 0.15f)
    {
        static constexpr std::array<std::string_view, 4> kCharacterRows{
            "1234567890",
            "QWERTYUIOP",
            "ASDFGHJKL",
            "ZXCVBNM",
        };
        const float keyHalfHeight = (kKeySize - 0.015f) * 0.5f;

        float y = kKeySize * 1.6f;
        for (auto chars : kCharacterRows)
        {
            const float xStart = -(static_cast<float>(chars.size()) - 1.0f) * kKeySize * 0.5f;
            for (std::size_t i = 0; i < chars.size(); ++i)
            {
                m_keys.push_back(Key{std::string(1, chars[i]),
                                     PanelRect{{xStart + static_cast<float>(i) * kKeySize, y},
                                               {kKeySize * 0.5f, keyHalfHeight}}});
            }
            y -= kKeySize;
        }

        // Wide keys on the last row
        const float wideHalf = kKeySize * 0.7f;
        m_keys.push_back(Key{std::string(kBackspace), PanelRect{{-kKeySize * 0.8f, y}, {wideHalf, keyHalfHeight}}});
        m_keys.push_back(Key{std::string(kLoad), PanelRect{{kKeySize * 0.8f, y}, {wideHalf, keyHalfHeight}}});
    }

    std::string StructureInputPanel::displayText() const
    {
        std::string out = m_text;
        out.resize(kMaxLength, '-');
        return out;
    }

    void StructureInputPanel::pressKey(std::string_view label)
    {
        if (label == kBackspace)
        {
            if (!m_text.empty())
                m_text.pop_back();
            return;
        }
        if (label == kLoad)
        {
            if (m_text.empty())
                return;
            hide();
            if (m_onLoad)
                m_onLoad(m_text);
            return;
        }
        if (label.size() != 1 || !std::isalnum(static_cast<unsigned char>(label.front())))
            return;
        if (m_text.size() < kMaxLength)
            m_text.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(label.front()))));
    }

    void StructureInputPanel::hoverAt(const std::optional<Vec2> &local)
    {
        m_hover = -1;
        if (!local)
            return;
        for (std::size_t i = 0; i < m_keys.size(); ++i)
        {
            if (m_keys[i].rect.contains(*local))
            {
                m_hover = static_cast<int>(i);
                return;
            }
        }
    }

    bool StructureInputPanel::select()
    {
        if (Panel::select())
            return true;
        if (m_hover == -1)
            return false;
        // Copy: pressing Load hides the panel, which clears the hover
        const std::string label = m_keys[static_cast<std::size_t>(m_hover)].label;
        pressKey(label);
        return true;
    }

} // namespace molxr::ui
