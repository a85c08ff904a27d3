#include <gtest/gtest.h>

#include "bridge/monitor_clamp.hpp"

using namespace dockbridge;

// Two side-by-side 1920x1080 monitors.
static const std::vector<Rect> MONITORS{{0, 0, 1920, 1080}, {1920, 0, 1920, 1080}};

// ─── monitor_for_rect ────────────────────────────────────────────────────────

TEST(MonitorForRect, LargestOverlapWins)
{
    auto m = monitor_for_rect(Rect{1800, 100, 400, 300}, MONITORS);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m, MONITORS[1]);

    auto left = monitor_for_rect(Rect{1700, 100, 400, 300}, MONITORS);
    EXPECT_EQ(*left, MONITORS[0]);
}

TEST(MonitorForRect, NearestWhenOffScreen)
{
    auto m = monitor_for_rect(Rect{-900, 200, 400, 300}, MONITORS);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m, MONITORS[0]);

    auto right = monitor_for_rect(Rect{5000, 2000, 100, 100}, MONITORS);
    EXPECT_EQ(*right, MONITORS[1]);
}

TEST(MonitorForRect, NoMonitors)
{
    EXPECT_FALSE(monitor_for_rect(Rect{0, 0, 10, 10}, {}).has_value());
}

// ─── clamp_to_monitors ───────────────────────────────────────────────────────

TEST(ClampToMonitors, KeepsWindowOnItsMonitor)
{
    EXPECT_EQ(clamp_to_monitors({100, 100}, {400, 300}, MONITORS), (Vec2{100, 100}));
    EXPECT_EQ(clamp_to_monitors({3700, 900}, {400, 300}, MONITORS), (Vec2{3440, 780}));
    EXPECT_EQ(clamp_to_monitors({-50, -20}, {400, 300}, MONITORS), (Vec2{0, 0}));
}

TEST(ClampToMonitors, OversizedPinnedToTopLeft)
{
    EXPECT_EQ(clamp_to_monitors({2500, 300}, {2500, 1200}, MONITORS), (Vec2{1920, 0}));
}

TEST(ClampToMonitors, NoMonitorsLeavesPosition)
{
    EXPECT_EQ(clamp_to_monitors({5000, 5000}, {100, 100}, {}), (Vec2{5000, 5000}));
}
