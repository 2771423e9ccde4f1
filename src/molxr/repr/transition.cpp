// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/repr/transition.hpp"

#include <algorithm>

namespace molxr::repr
{

    void TransitionAnimator::begin(Engine::Scene::SceneData &scene, GroupPtr outgoing, GroupPtr incoming, float targetScale)
    {
        if (m_active)
        {
            // Interrupted: the half-grown incoming group becomes the one to fade out
            dropOutgoing(scene);
            if (m_incoming && m_incoming != incoming)
                outgoing = m_incoming;
        }

        m_outgoing = std::move(outgoing);
        m_incoming = std::move(incoming);
        m_targetScale = targetScale;
        m_elapsed = 0.0f;
        m_active = static_cast<bool>(m_incoming);
        m_outgoingFrom = 1.0f;
        if (m_outgoing && m_targetScale > 0.0f)
            m_outgoingFrom = std::clamp(m_outgoing->uniformScale() / m_targetScale, kStartFraction, 1.0f);

        if (!m_incoming)
        {
            dropOutgoing(scene);
            return;
        }
        m_incoming->transform.position = m_outgoing ? m_outgoing->transform.position : m_incoming->transform.position;
        m_incoming->setUniformScale(kStartFraction * m_targetScale);
        scene.add(m_incoming);
    }

    bool TransitionAnimator::step(Engine::Scene::SceneData &scene, float dt)
    {
        if (!m_active)
            return false;

        m_elapsed += dt;
        const float t = std::min(m_elapsed / m_duration, 1.0f);
        m_incoming->setUniformScale(Engine::Math::lerp(kStartFraction, 1.0f, t) * m_targetScale);
        if (m_outgoing)
            m_outgoing->setUniformScale(Engine::Math::lerp(m_outgoingFrom, kStartFraction, t) * m_targetScale);

        if (m_elapsed >= m_duration)
        {
            finish(scene);
            return true;
        }
        return false;
    }

    void TransitionAnimator::finish(Engine::Scene::SceneData &scene)
    {
        if (!m_active)
            return;
        dropOutgoing(scene);
        m_incoming->setUniformScale(m_targetScale);
        m_incoming.reset();
        m_active = false;
    }

    void TransitionAnimator::dropOutgoing(Engine::Scene::SceneData &scene)
    {
        if (!m_outgoing)
            return;
        scene.remove(m_outgoing.get());
        m_outgoing->releaseResources();
        m_outgoing.reset();
    }

} // namespace molxr::repr
