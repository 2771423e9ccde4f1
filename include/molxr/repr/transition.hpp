// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "engine/scene/Scene.hpp"
#include "molxr/repr/builders.hpp"

namespace molxr::repr
{

    // Scale cross-fade between the representation being replaced and its successor.
    // The incoming group grows from 1% to full size while the outgoing one shrinks.
    class TransitionAnimator
    {
    public:
        static constexpr float kStartFraction = 0.01f;
        static constexpr float kDefaultDuration = 0.5f;

        explicit TransitionAnimator(float durationSeconds = kDefaultDuration)
            : m_duration(durationSeconds > 0.0f ? durationSeconds : kDefaultDuration) {}

        // Adds `incoming` to the scene at 1% of `targetScale`. `outgoing` may be null;
        // it shrinks from the scale it has when the transition begins.
        void begin(Engine::Scene::SceneData &scene, GroupPtr outgoing, GroupPtr incoming, float targetScale);

        // Returns true on the frame the transition completes
        bool step(Engine::Scene::SceneData &scene, float dt);

        // Drops the outgoing group immediately and snaps the incoming one to full size
        void finish(Engine::Scene::SceneData &scene);

        bool active() const { return m_active; }
        float elapsed() const { return m_elapsed; }
        float duration() const { return m_duration; }
        void setDuration(float seconds)
        {
            if (seconds > 0.0f)
                m_duration = seconds;
        }
        const GroupPtr &incoming() const { return m_incoming; }
        const GroupPtr &outgoing() const { return m_outgoing; }

    private:
        void dropOutgoing(Engine::Scene::SceneData &scene);

        GroupPtr m_outgoing;
        GroupPtr m_incoming;
        float m_targetScale{1.0f};
        float m_outgoingFrom{1.0f}; // outgoing scale at begin, as a fraction of the target
        float m_elapsed{0.0f};
        float m_duration;
        bool m_active{false};
    };

} // namespace molxr::repr
