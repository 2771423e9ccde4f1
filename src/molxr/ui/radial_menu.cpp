// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/ui/radial_menu.hpp"

#include "engine/gfx/MeshFactory.hpp"

#include <algorithm>
#include <cmath>

namespace molxr::ui
{
    using Engine::Math::kTwoPi;

    RadialMenu::RadialMenu(std::vector<MenuItem> items, float radius)
        : m_items(std::move(items)),
          m_radius(radius),
          m_group(std::make_shared<Engine::Scene::RenderGroup>())
    {
        if (m_items.empty())
            return;

        const float arc = kTwoPi / static_cast<float>(m_items.size());
        m_wedgeMaterials.reserve(m_items.size());
        for (std::size_t i = 0; i < m_items.size(); ++i)
        {
            Engine::Scene::RenderableEntity wedge;
            wedge.mesh = m_group->addMesh(
                Engine::Gfx::CreateRingSector(m_radius * kInnerRadiusFraction, m_radius, 32,
                                              static_cast<float>(i) * arc, arc));
            Engine::ECS::Material mat = Engine::ECS::SolidMaterial(kWedgeBaseColor);
            mat.doubleSided = true;
            wedge.material = m_group->addMaterial(mat);
            m_wedgeMaterials.push_back(wedge.material);
            m_group->renderables.push_back(wedge);
        }
    }

    void RadialMenu::setVisible(bool visible)
    {
        m_visible = visible;
        for (auto &r : m_group->renderables)
            r.style = visible ? Engine::ECS::RenderStyle::Solid : Engine::ECS::RenderStyle::Hidden;
        if (!visible)
            setHover(-1);
    }

    void RadialMenu::setHover(int index)
    {
        if (index < -1 || index >= static_cast<int>(m_items.size()))
            index = -1;
        if (index == m_hover)
            return;
        if (m_hover != -1)
            paintWedge(m_hover, kWedgeBaseColor);
        m_hover = index;
        if (m_hover != -1)
            paintWedge(m_hover, kWedgeHighlightColor);
    }

    std::optional<float> RadialMenu::intersect(const Engine::Math::Ray &worldRay, int *wedgeIndex) const
    {
        // Local-space ray keeps an unnormalized direction so t matches the world ray
        const auto local = Engine::Math::transformRay(transform().inverseMatrix(), worldRay);

        std::optional<float> best;
        int bestIndex = -1;
        for (std::size_t w = 0; w < m_group->renderables.size(); ++w)
        {
            const auto *mesh = m_group->renderables[w].mesh;
            const auto &v = mesh->vertices;
            for (std::size_t k = 0; k + 2 < mesh->indices.size(); k += 3)
            {
                const auto &a = v[mesh->indices[k]];
                const auto &b = v[mesh->indices[k + 1]];
                const auto &c = v[mesh->indices[k + 2]];
                auto t = Engine::Math::intersectTriangle(local, {a.px, a.py, a.pz}, {b.px, b.py, b.pz}, {c.px, c.py, c.pz});
                if (t && (!best || *t < *best))
                {
                    best = t;
                    bestIndex = static_cast<int>(w);
                }
            }
        }
        if (wedgeIndex)
            *wedgeIndex = bestIndex;
        return best;
    }

    int RadialMenu::handlePointer(const Engine::Math::Ray &worldRay)
    {
        if (!m_visible)
        {
            setHover(-1);
            return m_hover;
        }
        int index = -1;
        intersect(worldRay, &index);
        setHover(index);
        return m_hover;
    }

    int RadialMenu::stickToIndex(float x, float y, std::size_t count, float deadZone)
    {
        if (count == 0)
            return -1;
        if (std::sqrt(x * x + y * y) < deadZone)
            return -1;
        float angle = std::atan2(x, y);
        if (angle < 0.0f)
            angle += kTwoPi;
        const float arc = kTwoPi / static_cast<float>(count);
        int index = static_cast<int>(std::floor(angle / arc));
        return std::clamp(index, 0, static_cast<int>(count) - 1);
    }

    int RadialMenu::hoverFromStick(float x, float y, float deadZone)
    {
        setHover(stickToIndex(x, y, m_items.size(), deadZone));
        return m_hover;
    }

    bool RadialMenu::select()
    {
        if (m_hover == -1)
            return false;
        const auto &action = m_items[static_cast<std::size_t>(m_hover)].action;
        if (action)
            action->execute();
        return true;
    }

    bool RadialMenu::setAction(std::string_view label, std::shared_ptr<Command> action)
    {
        auto it = std::find_if(m_items.begin(), m_items.end(),
                               [label](const MenuItem &item)
                               { return item.label == label; });
        if (it == m_items.end())
            return false;
        it->action = std::move(action);
        return true;
    }

    void RadialMenu::setOpacity(float opacity)
    {
        m_opacity = std::clamp(opacity, 0.0f, 1.0f);
        for (auto *mat : m_wedgeMaterials)
        {
            mat->transparent = m_opacity < 1.0f;
            mat->opacity = m_opacity;
        }
    }

    void RadialMenu::faceTowards(const Engine::Math::Vec3 &viewer)
    {
        const auto toViewer = viewer - transform().position;
        if (Engine::Math::lengthSquared(toViewer) <= 0.0f)
            return;
        transform().rotationEulerRad = Engine::Math::eulerAligningZTo(Engine::Math::normalize(toViewer));
    }

    std::uint32_t RadialMenu::wedgeColor(std::size_t index) const
    {
        return Engine::ECS::MaterialColorHex(*m_wedgeMaterials.at(index));
    }

    void RadialMenu::paintWedge(int index, std::uint32_t hex)
    {
        Engine::ECS::SetMaterialColor(*m_wedgeMaterials[static_cast<std::size_t>(index)], hex);
    }

} // namespace molxr::ui
