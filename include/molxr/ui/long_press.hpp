// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>

namespace molxr::ui
{
    constexpr double kDefaultLongPressSeconds = 0.4;

    enum class PressState : std::uint8_t
    {
        Idle,
        Held,
        Open
    };

    enum class ReleaseResult : std::uint8_t
    {
        None,     // release without a matching press
        Tap,      // released before the context menu opened
        CloseMenu // released while the context menu was open
    };

    // Trigger hold detector: Idle -> Held on press, Held -> Open once the hold
    // exceeds the threshold, back to Idle on release. Times are in seconds.
    class LongPressTracker
    {
    public:
        explicit LongPressTracker(double thresholdSeconds = kDefaultLongPressSeconds)
            : m_threshold(thresholdSeconds) {}

        void press(double now);

        // Returns true on the update that opens the context menu
        bool update(double now);

        ReleaseResult release(double now);

        PressState state() const { return m_state; }
        double threshold() const { return m_threshold; }
        void setThreshold(double seconds) { m_threshold = seconds; }
        double heldFor(double now) const;

    private:
        PressState m_state{PressState::Idle};
        double m_pressedAt{0.0};
        double m_threshold;
    };

} // namespace molxr::ui
