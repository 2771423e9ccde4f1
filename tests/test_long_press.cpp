// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include "molxr/ui/long_press.hpp"

using molxr::ui::LongPressTracker;
using molxr::ui::PressState;
using molxr::ui::ReleaseResult;

TEST(LongPress, QuickReleaseIsTap)
{
    LongPressTracker t;
    t.press(1.0);
    EXPECT_EQ(t.state(), PressState::Held);
    EXPECT_FALSE(t.update(1.2));
    EXPECT_EQ(t.release(1.25), ReleaseResult::Tap);
    EXPECT_EQ(t.state(), PressState::Idle);
}

TEST(LongPress, HoldPastThresholdOpensOnce)
{
    LongPressTracker t(0.4);
    t.press(0.0);
    EXPECT_FALSE(t.update(0.4));
    EXPECT_TRUE(t.update(0.41));
    EXPECT_EQ(t.state(), PressState::Open);
    EXPECT_FALSE(t.update(0.9));
    EXPECT_EQ(t.release(1.0), ReleaseResult::CloseMenu);
    EXPECT_EQ(t.state(), PressState::Idle);
}

TEST(LongPress, LateReleaseWithoutUpdateIsStillTap)
{
    LongPressTracker t(0.4);
    t.press(0.0);
    EXPECT_EQ(t.release(2.0), ReleaseResult::Tap);
}

TEST(LongPress, ReleaseWithoutPressDoesNothing)
{
    LongPressTracker t;
    EXPECT_EQ(t.release(0.5), ReleaseResult::None);
    EXPECT_FALSE(t.update(5.0));
    EXPECT_EQ(t.state(), PressState::Idle);
}

TEST(LongPress, RepeatedPressKeepsFirstTimestamp)
{
    LongPressTracker t(0.4);
    t.press(0.0);
    t.press(0.3);
    EXPECT_DOUBLE_EQ(t.heldFor(0.35), 0.35);
    EXPECT_TRUE(t.update(0.45));
}

TEST(LongPress, ThresholdIsAdjustable)
{
    LongPressTracker t;
    t.setThreshold(1.0);
    EXPECT_DOUBLE_EQ(t.threshold(), 1.0);
    t.press(0.0);
    EXPECT_FALSE(t.update(0.9));
    EXPECT_TRUE(t.update(1.1));
    EXPECT_DOUBLE_EQ(t.heldFor(1.5), 1.5);
    t.release(1.5);
    EXPECT_DOUBLE_EQ(t.heldFor(2.0), 0.0);
}
