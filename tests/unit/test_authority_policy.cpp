#include <gtest/gtest.h>

#include "bridge/authority_policy.hpp"

using namespace dockbridge;

// Horizontal[pane 1 | pane 2] in an 800x600 dock rect.
class AuthorityPolicyTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        a_     = tree_.add_pane(1);
        b_     = tree_.add_pane(2);
        split_ = tree_.add_container(TileKind::Horizontal, {a_, b_});
        tree_.set_root(split_);
        tree_.layout(DOCK, options_.tab_bar_height);
    }

    OverlayDecision decide(const Vec2&           p,
                           DragKind              kind,
                           std::optional<TileId> dragged = std::nullopt,
                           Modifiers             mods    = {}) const
    {
        return AuthorityPolicy(options_).decide(tree_, DOCK, p, kind, dragged, mods);
    }

    static constexpr Rect DOCK{0, 0, 800, 600};

    DockingOptions options_;
    DockTree       tree_;
    TileId         a_     = INVALID_TILE_ID;
    TileId         b_     = INVALID_TILE_ID;
    TileId         split_ = INVALID_TILE_ID;
};

// ─── Internal drags ──────────────────────────────────────────────────────────

TEST_F(AuthorityPolicyTest, InternalDragOffTargetsBelongsToTree)
{
    auto d = decide({710, 150}, DragKind::InternalSubtree, a_);
    EXPECT_EQ(d.authority, Authority::Tree);
    ASSERT_TRUE(d.has_tree_target());
    EXPECT_EQ(d.tree_zone->insertion.parent, b_);
    EXPECT_EQ(d.tree_zone->preview, (Rect{600, 0, 200, 600}));
    EXPECT_FALSE(d.paint.has_value());
    EXPECT_FALSE(d.suppress_tree_preview);
    EXPECT_FALSE(d.insertion_final.has_value());
}

TEST_F(AuthorityPolicyTest, InternalDragOnExplicitTargetBridgeTakesOver)
{
    // Top box of pane 2's inner cross.
    auto d = decide({600, 230}, DragKind::InternalSubtree, a_);
    EXPECT_EQ(d.authority, Authority::Bridge);
    EXPECT_EQ(d.hovered, DockSide::Top);
    EXPECT_TRUE(d.suppress_tree_preview);
    EXPECT_TRUE(d.paint.has_value());
    EXPECT_EQ(d.insertion_final, insertion_for_side(b_, DockSide::Top));
    EXPECT_TRUE(d.has_bridge_target());
    EXPECT_TRUE(d.preview_rect.has_value());
}

TEST_F(AuthorityPolicyTest, InternalDragIgnoresRadialHit)
{
    auto d = decide({650, 340}, DragKind::InternalSubtree, a_);
    EXPECT_FALSE(d.insertion_explicit.has_value());
    EXPECT_EQ(d.authority, Authority::Tree);
}

TEST_F(AuthorityPolicyTest, InternalDragNeverTargetsItself)
{
    // Over the dragged tile's own center: the overlay anchors on the parent
    // split, and the tree zone inside the dragged tile is dropped.
    auto d = decide({200, 300}, DragKind::InternalSubtree, a_);
    EXPECT_EQ(d.authority, Authority::Tree);
    EXPECT_FALSE(d.has_tree_target());
    EXPECT_FALSE(d.insertion_explicit.has_value());
}

// ─── External drags ──────────────────────────────────────────────────────────

TEST_F(AuthorityPolicyTest, ExternalDragFallsBackToHeuristicZone)
{
    auto d = decide({710, 150}, DragKind::ExternalSubtree);
    EXPECT_EQ(d.authority, Authority::Bridge);
    ASSERT_TRUE(d.fallback_zone.has_value());
    EXPECT_EQ(d.insertion_final, d.fallback_zone->insertion);
    EXPECT_EQ(d.preview_rect, (Rect{600, 0, 200, 600}));
    EXPECT_TRUE(d.paint.has_value());
}

TEST_F(AuthorityPolicyTest, ExternalDragAcceptsRadialHit)
{
    auto d = decide({650, 340}, DragKind::ExternalSubtree);
    EXPECT_EQ(d.hovered, DockSide::Right);
    EXPECT_EQ(d.insertion_final, insertion_for_side(b_, DockSide::Right));
}

TEST_F(AuthorityPolicyTest, OuterTargetInBand)
{
    auto d = decide({754, 300}, DragKind::ExternalSubtree);
    EXPECT_EQ(d.authority, Authority::Bridge);
    ASSERT_TRUE(d.paint.has_value());
    EXPECT_TRUE(d.paint->outer);
    EXPECT_EQ(d.hovered, DockSide::Right);
    EXPECT_EQ(d.insertion_final, insertion_for_side(split_, DockSide::Right));
    EXPECT_EQ(d.preview_rect, (Rect{400, 0, 400, 600}));
}

TEST_F(AuthorityPolicyTest, OuterTargetsDisabled)
{
    options_.show_outer_overlay_targets = false;
    auto d                              = decide({754, 300}, DragKind::ExternalSubtree);
    ASSERT_TRUE(d.paint.has_value());
    EXPECT_FALSE(d.paint->outer);
}

TEST(AuthorityPolicyEmpty, ExternalDropBecomesRoot)
{
    DockingOptions  options;
    DockTree        tree;
    AuthorityPolicy policy(options);

    auto d = policy.decide(tree, Rect{0, 0, 800, 600}, {100, 100}, DragKind::ExternalSubtree,
                           std::nullopt, {});
    EXPECT_EQ(d.authority, Authority::Bridge);
    EXPECT_TRUE(d.into_empty_tree);
    EXPECT_TRUE(d.has_bridge_target());
    EXPECT_EQ(d.preview_rect, (Rect{0, 0, 800, 600}));

    auto w = policy.decide(tree, Rect{0, 0, 800, 600}, {100, 100}, DragKind::WindowMove,
                           std::nullopt, {});
    EXPECT_EQ(w.authority, Authority::None);
    EXPECT_FALSE(w.into_empty_tree);
}

TEST_F(AuthorityPolicyTest, PointerOutsideDockRect)
{
    auto d = decide({900, 300}, DragKind::ExternalSubtree);
    EXPECT_EQ(d.authority, Authority::None);
    EXPECT_FALSE(d.paint.has_value());
}

// ─── Window moves ────────────────────────────────────────────────────────────

TEST_F(AuthorityPolicyTest, WindowMoveNeedsExplicitTarget)
{
    auto miss = decide({710, 150}, DragKind::WindowMove);
    EXPECT_EQ(miss.authority, Authority::None);
    EXPECT_FALSE(miss.insertion_final.has_value());
    // Targets are still painted so the user sees where to aim.
    EXPECT_TRUE(miss.paint.has_value());

    auto center = decide({600, 300}, DragKind::WindowMove);
    EXPECT_EQ(center.authority, Authority::Bridge);
    EXPECT_EQ(center.insertion_final, insertion_for_side(b_, DockSide::Center));
}

TEST_F(AuthorityPolicyTest, WindowMoveOnTitleBandTabs)
{
    auto d = decide({600, 10}, DragKind::WindowMove);
    EXPECT_EQ(d.authority, Authority::Bridge);
    ASSERT_TRUE(d.insertion_final.has_value());
    EXPECT_EQ(d.insertion_final->parent, b_);
    EXPECT_EQ(d.insertion_final->kind, TileKind::Tabs);
    EXPECT_EQ(d.preview_rect, (Rect{400, 0, 400, 24}));
}

TEST_F(AuthorityPolicyTest, WindowMoveShiftGate)
{
    auto held = decide({600, 300}, DragKind::WindowMove, std::nullopt, Modifiers{.shift = true});
    EXPECT_TRUE(held.gated);
    EXPECT_EQ(held.authority, Authority::None);

    options_.docking_with_shift = true;
    auto released               = decide({600, 300}, DragKind::WindowMove);
    EXPECT_TRUE(released.gated);
    auto with_shift = decide({600, 300}, DragKind::WindowMove, std::nullopt, Modifiers{.shift = true});
    EXPECT_FALSE(with_shift.gated);
    EXPECT_EQ(with_shift.authority, Authority::Bridge);
}

TEST_F(AuthorityPolicyTest, WindowMoveZoneOnTabBar)
{
    TileId c    = tree_.add_pane(3);
    TileId d    = tree_.add_pane(4);
    TileId tabs = tree_.add_container(TileKind::Tabs, {c, d});
    tree_.set_root(tabs);
    tree_.layout(DOCK, options_.tab_bar_height);

    AuthorityPolicy policy(options_);
    auto            zone = policy.window_move_zone(tree_, {150, 10});
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->insertion.parent, tabs);
    EXPECT_EQ(zone->insertion.index, 1u);
    EXPECT_FALSE(policy.window_move_zone(tree_, {150, 300}).has_value());
}

TEST(AuthorityName, Names)
{
    EXPECT_STREQ(authority_name(Authority::None), "none");
    EXPECT_STREQ(authority_name(Authority::Tree), "tree");
    EXPECT_STREQ(authority_name(Authority::Bridge), "bridge");
}
