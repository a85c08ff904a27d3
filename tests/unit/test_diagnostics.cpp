#include <gtest/gtest.h>

#include "util/bridge_fixture.hpp"

using namespace dockbridge;
using namespace dockbridge::test;

// ─── Ring buffer ─────────────────────────────────────────────────────────────

TEST(DiagnosticsLog, OldestRecordDroppedFirst)
{
    DiagnosticsLog log(3);
    for (uint64_t frame = 1; frame <= 5; ++frame)
        log.record(frame, DiagnosticKind::Drop, "drop " + std::to_string(frame));

    ASSERT_EQ(log.records().size(), 3u);
    EXPECT_EQ(log.records().front().frame, 3u);
    EXPECT_EQ(log.records().back().message, "drop 5");
}

TEST(DiagnosticsLog, CountAndFilterByKind)
{
    DiagnosticsLog log;
    log.record(1, DiagnosticKind::StaleHint, "a");
    log.record(1, DiagnosticKind::Drop, "b");
    log.record(2, DiagnosticKind::StaleHint, "c");

    EXPECT_EQ(log.count(DiagnosticKind::StaleHint), 2u);
    EXPECT_EQ(log.count(DiagnosticKind::DoubleClaim), 0u);
    auto hints = log.of_kind(DiagnosticKind::StaleHint);
    ASSERT_EQ(hints.size(), 2u);
    EXPECT_EQ(hints[1].message, "c");

    log.clear();
    EXPECT_TRUE(log.records().empty());
}

TEST(DiagnosticsLog, ShrinkingCapacityTrims)
{
    DiagnosticsLog log(10);
    for (uint64_t frame = 0; frame < 6; ++frame)
        log.record(frame, DiagnosticKind::Lifecycle, "x");
    log.set_capacity(2);
    EXPECT_EQ(log.capacity(), 2u);
    ASSERT_EQ(log.records().size(), 2u);
    EXPECT_EQ(log.records().front().frame, 4u);
}

TEST(DiagnosticsLog, ZeroCapacityRecordsNothing)
{
    DiagnosticsLog log(0);
    log.record(1, DiagnosticKind::Drop, "ignored");
    EXPECT_TRUE(log.records().empty());
}

TEST(DiagnosticsLog, KindNames)
{
    EXPECT_STREQ(diagnostic_kind_name(DiagnosticKind::StaleHint), "stale-hint");
    EXPECT_STREQ(diagnostic_kind_name(DiagnosticKind::IntegrityIssue), "integrity");
    EXPECT_STREQ(diagnostic_kind_name(DiagnosticKind::DoubleClaim), "double-claim");
}

// ─── Bridge recording ────────────────────────────────────────────────────────

class DiagnosticsTest : public BridgeFixture
{
};

TEST_F(DiagnosticsTest, DropsRecordedWithPhase)
{
    bridge_->begin_tile_drag(ROOT_VIEWPORT_ID, std::nullopt, left_, {200, 300});
    release_at({710, 150}, ROOT_VIEWPORT_ID);

    auto drops = bridge_->diagnostics().of_kind(DiagnosticKind::Drop);
    ASSERT_EQ(drops.size(), 1u);
    EXPECT_EQ(drops[0].message, "reordered via local-resolve");
    EXPECT_EQ(drops[0].frame, bridge_->frame());
}

TEST_F(DiagnosticsTest, NothingRecordedWhenDisabled)
{
    DockingOptions options  = test_options();
    options.debug_event_log = false;
    make_bridge(options);

    bridge_->begin_tile_drag(ROOT_VIEWPORT_ID, std::nullopt, left_, {200, 300});
    release_at({1200, 300}, ViewportId{9});
    EXPECT_TRUE(bridge_->diagnostics().records().empty());
}

TEST_F(DiagnosticsTest, StaleHintForUnknownViewport)
{
    bridge_->run_frame(make_input(*bridge_, PointerFrame{.global = {100, 100}, .hovered = ViewportId{42}}));
    EXPECT_EQ(bridge_->diagnostics().count(DiagnosticKind::StaleHint), 1u);
}

TEST_F(DiagnosticsTest, LifecycleEventsRecorded)
{
    bridge_->begin_tile_drag(ROOT_VIEWPORT_ID, std::nullopt, left_, {200, 300});
    release_at({1200, 300});
    auto lifecycle = bridge_->diagnostics().of_kind(DiagnosticKind::Lifecycle);
    ASSERT_FALSE(lifecycle.empty());
    EXPECT_NE(lifecycle.front().message.find("detached-created"), std::string::npos);
}

TEST_F(DiagnosticsTest, IntegrityIssuesReported)
{
    // A pane tile that is neither the root nor any container's child.
    root().add_pane(9);
    bridge_->run_frame(idle_input(*bridge_));
    EXPECT_GE(bridge_->diagnostics().count(DiagnosticKind::IntegrityIssue), 1u);

    auto issues = bridge_->diagnostics().of_kind(DiagnosticKind::IntegrityIssue);
    EXPECT_EQ(issues.front().message.rfind("root: ", 0), 0u);
}

TEST_F(DiagnosticsTest, IntegrityChecksOff)
{
    DockingOptions options  = test_options();
    options.debug_integrity = false;
    make_bridge(options);

    root().add_pane(9);
    bridge_->run_frame(idle_input(*bridge_));
    EXPECT_EQ(bridge_->diagnostics().count(DiagnosticKind::IntegrityIssue), 0u);
}
