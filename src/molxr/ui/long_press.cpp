// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/ui/long_press.hpp"

namespace molxr::ui
{

    void LongPressTracker::press(double now)
    {
        if (m_state != PressState::Idle)
            return;
        m_state = PressState::Held;
        m_pressedAt = now;
    }

    bool LongPressTracker::update(double now)
    {
        if (m_state != PressState::Held)
            return false;
        if (now - m_pressedAt > m_threshold)
        {
            m_state = PressState::Open;
            return true;
        }
        return false;
    }

    ReleaseResult LongPressTracker::release(double /*now*/)
    {
        switch (m_state)
        {
        case PressState::Held:
            // Opening only happens in update(), so a release here is always a tap
            m_state = PressState::Idle;
            return ReleaseResult::Tap;
        case PressState::Open:
            m_state = PressState::Idle;
            return ReleaseResult::CloseMenu;
        default:
            return ReleaseResult::None;
        }
    }

    double LongPressTracker::heldFor(double now) const
    {
        if (m_state == PressState::Idle)
            return 0.0;
        return now - m_pressedAt;
    }

} // namespace molxr::ui
