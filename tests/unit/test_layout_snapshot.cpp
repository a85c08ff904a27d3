#include <gtest/gtest.h>

#include <map>
#include <string>

#include "util/bridge_fixture.hpp"

using namespace dockbridge;
using namespace dockbridge::test;

// Stable ids "pane-<n>" for a fixed set of panes.
class MapRegistry : public PaneRegistry
{
   public:
    explicit MapRegistry(std::vector<PaneId> panes)
    {
        for (PaneId p : panes)
            ids_[p] = "pane-" + std::to_string(p);
    }

    std::optional<std::string> stable_id(PaneId pane) const override
    {
        auto it = ids_.find(pane);
        if (it == ids_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<PaneId> resolve(const std::string& stable) const override
    {
        for (const auto& [pane, id] : ids_)
        {
            if (id == stable)
                return pane;
        }
        return std::nullopt;
    }

   private:
    std::map<PaneId, std::string> ids_;
};

class LayoutSnapshotTest : public BridgeFixture
{
   protected:
    void SetUp() override
    {
        BridgeFixture::SetUp();
        vp_ = add_detached({3, 4}, {1000, 100}, {400, 300});

        DockTree tree = bridge_->model().make_tree();
        tree.set_root(tree.add_pane(5));
        fid_ = bridge_->model().add_floating(ROOT_VIEWPORT_ID, std::move(tree), {50, 50}, {200, 150});
        bridge_->model().floating_window(ROOT_VIEWPORT_ID, fid_)->collapsed = true;
        bridge_->run_frame(idle_input(*bridge_));
    }

    MapRegistry all_{std::vector<PaneId>{1, 2, 3, 4, 5}};
    ViewportId  vp_  = 0;
    FloatingId  fid_ = 0;
};

// ─── Capture / restore ───────────────────────────────────────────────────────

TEST_F(LayoutSnapshotTest, CaptureListsEveryWindow)
{
    LayoutSnapshot snapshot = bridge_->capture_layout(all_);
    EXPECT_EQ(snapshot.version, LayoutSnapshot::FORMAT_VERSION);
    EXPECT_TRUE(snapshot.root.root.has_value());
    EXPECT_EQ(snapshot.root.tiles.size(), 3u);
    ASSERT_EQ(snapshot.detached.size(), 1u);
    EXPECT_EQ(snapshot.detached[0].viewport, vp_);
    EXPECT_EQ(snapshot.detached[0].placement.title, "Pane 3");
    ASSERT_EQ(snapshot.floating.size(), 1u);
    EXPECT_TRUE(snapshot.floating[0].collapsed);
    EXPECT_EQ(snapshot.next_viewport, vp_ + 1);
}

TEST_F(LayoutSnapshotTest, JsonRestoreReproducesModel)
{
    const std::string json = serialize_json(bridge_->capture_layout(all_));

    LayoutSnapshot parsed;
    ASSERT_TRUE(deserialize_json(json, parsed));

    RecordingWindowBackend other_backend;
    DockingBridge          other(2, test_options(), &other_backend);
    auto                   report = other.restore_layout(parsed, all_);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->dropped_panes, 0u);
    EXPECT_EQ(report->dropped_windows, 0u);

    EXPECT_EQ(other.model().serialize(), bridge_->model().serialize());
    EXPECT_EQ(other_backend.windows.count(vp_), 1u);
    EXPECT_EQ(other.model().next_viewport_id(), bridge_->model().next_viewport_id());
    EXPECT_EQ(other.model().next_floating_id(), bridge_->model().next_floating_id());
}

TEST_F(LayoutSnapshotTest, UnresolvedPanesDropped)
{
    LayoutSnapshot snapshot = bridge_->capture_layout(all_);

    // Panes 2, 3 and 4 no longer exist.
    MapRegistry survivors(std::vector<PaneId>{1, 5});
    auto        report = bridge_->restore_layout(snapshot, survivors);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->dropped_panes, 3u);
    EXPECT_EQ(report->dropped_windows, 1u);

    // The root split collapses onto the remaining pane.
    EXPECT_EQ(panes_of(root()), (std::vector<PaneId>{1}));
    EXPECT_EQ(root().get(*root().root())->kind, TileKind::Pane);
    EXPECT_TRUE(bridge_->model().detached_docks().empty());
    EXPECT_NE(bridge_->model().floating_if(ROOT_VIEWPORT_ID), nullptr);
    EXPECT_TRUE(root().integrity_issues().empty());
}

TEST_F(LayoutSnapshotTest, PaneWithoutStableIdNotRestored)
{
    MapRegistry    partial(std::vector<PaneId>{1, 3, 4, 5});
    LayoutSnapshot snapshot = bridge_->capture_layout(partial);
    auto           report   = bridge_->restore_layout(snapshot, all_);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->dropped_panes, 1u);
    EXPECT_EQ(panes_of(root()), (std::vector<PaneId>{1}));
}

TEST_F(LayoutSnapshotTest, ActiveTabSurvivesRestore)
{
    DockTree& tree = bridge_->model().detached(vp_)->tree;
    TileId    tabs = *tree.root();
    tree.set_active_tab(tabs, *tree.find_pane(4));

    LayoutSnapshot snapshot = bridge_->capture_layout(all_);
    bridge_->restore_layout(snapshot, all_);

    const DockTree& restored = bridge_->model().detached(vp_)->tree;
    EXPECT_EQ(restored.get(*restored.root())->active, restored.find_pane(4));
}

TEST_F(LayoutSnapshotTest, RestoreRecreatesWindows)
{
    LayoutSnapshot snapshot = bridge_->capture_layout(all_);
    const int      created  = backend_.create_calls;

    ASSERT_TRUE(bridge_->restore_layout(snapshot, all_).has_value());
    EXPECT_EQ(backend_.destroyed, (std::vector<ViewportId>{vp_}));
    EXPECT_EQ(backend_.create_calls, created + 1);
    EXPECT_EQ(backend_.windows.count(vp_), 1u);
}

TEST_F(LayoutSnapshotTest, RestoreRefusedDuringDrag)
{
    LayoutSnapshot snapshot = bridge_->capture_layout(all_);
    bridge_->begin_tile_drag(ROOT_VIEWPORT_ID, std::nullopt, left_, {200, 300});
    EXPECT_FALSE(bridge_->restore_layout(snapshot, all_).has_value());
    EXPECT_TRUE(bridge_->model().has_viewport(vp_));
}

TEST(LayoutSnapshotRestore, PlacementClampedToMonitors)
{
    DockingOptions options;
    DockModel      source(options);
    DockTree       tree = source.make_tree();
    tree.set_root(tree.add_pane(3));
    ViewportPlacement placement;
    placement.position = {1900, 100};
    placement.size     = {400, 300};
    source.add_detached(std::move(tree), placement);

    MapRegistry    registry(std::vector<PaneId>{3});
    LayoutSnapshot snapshot = capture_layout(source, registry);

    DockModel target(options);
    auto      report = restore_layout(target, snapshot, registry, std::vector<Rect>{{0, 0, 1920, 1080}});
    EXPECT_EQ(report.clamped_windows, 1u);
    ASSERT_EQ(target.detached_docks().size(), 1u);
    EXPECT_EQ(target.detached_docks().begin()->second.placement.position, (Vec2{1520, 100}));
}

TEST(LayoutSnapshotRestore, CollapsedSplitJoinsSameDirectionParent)
{
    // Horizontal[1, Vertical[2, Horizontal[3, 4]]] with pane 2 gone.
    using TS = LayoutSnapshot::TileState;
    LayoutSnapshot snapshot;
    snapshot.root.root  = 10;
    snapshot.root.tiles = {
        TS{.id = 10, .kind = TileKind::Horizontal, .children = {1, 11}},
        TS{.id = 1, .kind = TileKind::Pane, .pane = "pane-1"},
        TS{.id = 11, .kind = TileKind::Vertical, .children = {2, 12}},
        TS{.id = 2, .kind = TileKind::Pane, .pane = "pane-2"},
        TS{.id = 12, .kind = TileKind::Horizontal, .children = {3, 4}},
        TS{.id = 3, .kind = TileKind::Pane, .pane = "pane-3"},
        TS{.id = 4, .kind = TileKind::Pane, .pane = "pane-4"},
    };

    DockingOptions options;
    DockModel      model(options);
    MapRegistry    registry(std::vector<PaneId>{1, 3, 4});
    auto           report = restore_layout(model, snapshot, registry);
    EXPECT_EQ(report.dropped_panes, 1u);

    // Same shape a live edit produces when pane 2 is closed.
    DockModel live(options);
    DockTree& expected = live.root_tree();
    TileId    p2       = expected.add_pane(2);
    TileId    inner    = expected.add_container(TileKind::Horizontal, {expected.add_pane(3), expected.add_pane(4)});
    expected.set_root(expected.add_container(
        TileKind::Horizontal, {expected.add_pane(1), expected.add_container(TileKind::Vertical, {p2, inner})}));
    ASSERT_TRUE(expected.extract_subtree(p2, false).has_value());

    const DockTree& restored = model.root_tree();
    ASSERT_TRUE(restored.root().has_value());
    EXPECT_EQ(restored.get(*restored.root())->children.size(), 3u);
    EXPECT_EQ(panes_of(restored), (std::vector<PaneId>{1, 3, 4}));
    EXPECT_EQ(restored.tile_count(), expected.tile_count());
    EXPECT_TRUE(restored.integrity_issues().empty());
}

TEST(LayoutSnapshotRestore, NewerVersionLeavesModelAlone)
{
    DockingOptions options;
    DockModel      model(options);
    model.root_tree().set_root(model.root_tree().add_pane(1));

    LayoutSnapshot snapshot;
    snapshot.version = LayoutSnapshot::FORMAT_VERSION + 1;
    MapRegistry registry(std::vector<PaneId>{1});
    restore_layout(model, snapshot, registry);
    EXPECT_EQ(model.root_tree().pane_count(), 1u);
}

// ─── JSON ────────────────────────────────────────────────────────────────────

TEST_F(LayoutSnapshotTest, JsonKeepsEscapedTitles)
{
    bridge_->set_title_provider([](PaneId) { return std::string("say \"hi\"\\now"); });
    bridge_->run_frame(idle_input(*bridge_));

    LayoutSnapshot parsed;
    ASSERT_TRUE(deserialize_json(serialize_json(bridge_->capture_layout(all_)), parsed));
    ASSERT_EQ(parsed.detached.size(), 1u);
    EXPECT_EQ(parsed.detached[0].placement.title, "say \"hi\"\\now");
    EXPECT_EQ(parsed.detached[0].placement.size, (Vec2{400, 300}));
    ASSERT_EQ(parsed.floating.size(), 1u);
    EXPECT_TRUE(parsed.floating[0].collapsed);
}

TEST(LayoutSnapshotJson, RejectsNewerVersion)
{
    LayoutSnapshot snapshot;
    snapshot.version = 3;
    LayoutSnapshot parsed;
    EXPECT_FALSE(deserialize_json(serialize_json(snapshot), parsed));
}

TEST(LayoutSnapshotJson, RejectsMalformedInput)
{
    LayoutSnapshot parsed;
    EXPECT_FALSE(deserialize_json("", parsed));
    EXPECT_FALSE(deserialize_json("{\"version\": 2}", parsed));
    EXPECT_FALSE(deserialize_json(
        "{\"version\": 2, \"root_tree\": {\"root\": 1, \"tiles\": [{\"id\": 1, \"kind\": \"bogus\"}]}}", parsed));
}

TEST(LayoutSnapshotJson, EmptyTree)
{
    LayoutSnapshot snapshot;
    LayoutSnapshot parsed;
    ASSERT_TRUE(deserialize_json(serialize_json(snapshot), parsed));
    EXPECT_FALSE(parsed.root.root.has_value());
    EXPECT_TRUE(parsed.root.tiles.empty());
    EXPECT_TRUE(parsed.detached.empty());
}
