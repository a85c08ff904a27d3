#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "tree/dock_tree.hpp"

using namespace dockbridge;

// Horizontal[pane 1, pane 2] laid out in 800x600.
class DockTreeTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        a_     = tree_.add_pane(1);
        b_     = tree_.add_pane(2);
        split_ = tree_.add_container(TileKind::Horizontal, {a_, b_});
        tree_.set_root(split_);
        tree_.layout(Rect{0, 0, 800, 600}, 24.0f);
    }

    std::vector<PaneId> panes() const
    {
        std::vector<PaneId> out;
        for (TileId id : tree_.pane_tiles())
            out.push_back(tree_.get(id)->pane);
        return out;
    }

    DockTree tree_;
    TileId   a_     = INVALID_TILE_ID;
    TileId   b_     = INVALID_TILE_ID;
    TileId   split_ = INVALID_TILE_ID;
};

static SubTree single_pane(DockTree& scratch, PaneId pane)
{
    TileId id = scratch.add_pane(pane);
    scratch.set_root(id);
    return *scratch.extract_subtree(id, true);
}

// ─── Construction ────────────────────────────────────────────────────────────

TEST_F(DockTreeTest, BuildAndQuery)
{
    EXPECT_EQ(tree_.pane_count(), 2u);
    EXPECT_EQ(tree_.first_pane(), 1u);
    EXPECT_EQ(tree_.parent_of(a_), split_);
    EXPECT_FALSE(tree_.parent_of(split_).has_value());
    EXPECT_EQ(tree_.find_pane(2), b_);
    EXPECT_FALSE(tree_.find_pane(9).has_value());
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

TEST(DockTreeConstruction, EmptyTree)
{
    DockTree tree;
    EXPECT_TRUE(tree.is_empty());
    EXPECT_EQ(tree.pane_count(), 0u);
    EXPECT_FALSE(tree.first_pane().has_value());
    EXPECT_TRUE(tree.integrity_issues().empty());
}

TEST(DockTreeConstruction, TabsActivateFirstChild)
{
    DockTree tree;
    TileId   p1   = tree.add_pane(1);
    TileId   p2   = tree.add_pane(2);
    TileId   tabs = tree.add_container(TileKind::Tabs, {p1, p2});
    tree.set_root(tabs);
    EXPECT_EQ(tree.get(tabs)->active, p1);
    EXPECT_TRUE(tree.set_active_tab(tabs, p2));
    EXPECT_EQ(tree.get(tabs)->active, p2);
    EXPECT_FALSE(tree.set_active_tab(tabs, 999));
    EXPECT_FALSE(tree.set_active_tab(p1, p2));
}

// ─── Extraction ──────────────────────────────────────────────────────────────

TEST_F(DockTreeTest, ExtractCollapsesSingleChildSplit)
{
    auto sub = tree_.extract_subtree(a_, false);
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(sub->root, a_);
    EXPECT_EQ(tree_.root(), b_);
    EXPECT_FALSE(tree_.contains(split_));
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

TEST_F(DockTreeTest, ExtractWithReservedIdsRekeys)
{
    TileId next = tree_.allocator()->peek_next();
    auto   sub  = tree_.extract_subtree(a_, true);
    ASSERT_TRUE(sub.has_value());
    EXPECT_GE(sub->root, next);
    EXPECT_EQ(sub->tiles.size(), 1u);
    EXPECT_EQ(sub->tiles.at(sub->root).pane, 1u);
}

TEST_F(DockTreeTest, ExtractMissingTile)
{
    EXPECT_FALSE(tree_.extract_subtree(999, true).has_value());
}

TEST_F(DockTreeTest, ExtractClearsDraggedTile)
{
    tree_.set_dragged_tile(a_);
    tree_.extract_subtree(a_, false);
    EXPECT_FALSE(tree_.dragged_tile_id().has_value());
}

TEST(DockTreeTabs, ClosingActiveTabActivatesNeighbour)
{
    DockTree tree;
    TileId   p1   = tree.add_pane(1);
    TileId   p2   = tree.add_pane(2);
    TileId   p3   = tree.add_pane(3);
    TileId   tabs = tree.add_container(TileKind::Tabs, {p1, p2, p3});
    tree.set_root(tabs);
    tree.set_active_tab(tabs, p2);

    tree.extract_subtree(p2, false);
    EXPECT_EQ(tree.get(tabs)->active, p3);
    EXPECT_TRUE(tree.integrity_issues().empty());
}

// ─── Insertion ───────────────────────────────────────────────────────────────

TEST(DockTreeInsert, IntoEmptyTreeBecomesRoot)
{
    DockTree tree;
    DockTree scratch(tree.allocator());
    SubTree  sub = single_pane(scratch, 5);

    auto root = tree.insert_subtree(sub, std::nullopt);
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(tree.root(), root);
    EXPECT_TRUE(sub.empty());
}

TEST_F(DockTreeTest, InsertNextToSiblingJoinsParentSplit)
{
    DockTree scratch(tree_.allocator());
    SubTree  sub = single_pane(scratch, 3);

    auto id = tree_.insert_subtree(sub, InsertionPoint{b_, TileKind::Horizontal, INSERT_AT_END});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(tree_.root(), split_);
    EXPECT_EQ(panes(), (std::vector<PaneId>{1, 2, 3}));
}

TEST_F(DockTreeTest, InsertAcrossAxisWrapsTarget)
{
    DockTree scratch(tree_.allocator());
    SubTree  sub = single_pane(scratch, 3);

    auto id = tree_.insert_subtree(sub, InsertionPoint{b_, TileKind::Vertical, 0});
    ASSERT_TRUE(id.has_value());

    auto wrapper = tree_.parent_of(b_);
    ASSERT_TRUE(wrapper.has_value());
    EXPECT_EQ(tree_.get(*wrapper)->kind, TileKind::Vertical);
    EXPECT_EQ(tree_.get(*wrapper)->children, (std::vector<TileId>{*id, b_}));
    EXPECT_EQ(tree_.parent_of(*wrapper), split_);
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

TEST_F(DockTreeTest, TabbingContainerFlattensIntoPanes)
{
    DockTree scratch(tree_.allocator());
    TileId   p3 = scratch.add_pane(3);
    TileId   p4 = scratch.add_pane(4);
    scratch.set_root(scratch.add_container(TileKind::Vertical, {p3, p4}));
    SubTree sub = *scratch.extract_subtree(*scratch.root(), true);

    auto first = tree_.insert_subtree(sub, InsertionPoint{a_, TileKind::Tabs, INSERT_AT_END});
    ASSERT_TRUE(first.has_value());

    auto tabs = tree_.parent_of(a_);
    ASSERT_TRUE(tabs.has_value());
    const Tile* t = tree_.get(*tabs);
    EXPECT_EQ(t->kind, TileKind::Tabs);
    EXPECT_EQ(t->children.size(), 3u);
    EXPECT_EQ(t->active, *first);
    for (TileId c : t->children)
        EXPECT_TRUE(tree_.get(c)->is_pane());
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

TEST_F(DockTreeTest, ContainerTabbingKeepsSubtree)
{
    tree_.set_allow_container_tabbing(true);
    DockTree scratch(tree_.allocator());
    TileId   p3 = scratch.add_pane(3);
    TileId   p4 = scratch.add_pane(4);
    scratch.set_root(scratch.add_container(TileKind::Vertical, {p3, p4}));
    SubTree sub = *scratch.extract_subtree(*scratch.root(), true);

    auto inserted = tree_.insert_subtree(sub, InsertionPoint{a_, TileKind::Tabs, INSERT_AT_END});
    ASSERT_TRUE(inserted.has_value());
    EXPECT_EQ(tree_.get(*inserted)->kind, TileKind::Vertical);
}

TEST_F(DockTreeTest, InsertRejectsMissingTarget)
{
    DockTree scratch(tree_.allocator());
    SubTree  sub = single_pane(scratch, 3);
    EXPECT_FALSE(tree_.insert_subtree(sub, InsertionPoint{999, TileKind::Tabs, 0}).has_value());
    EXPECT_FALSE(sub.empty());
}

TEST_F(DockTreeTest, InsertRejectsTargetInsideSubtree)
{
    DockTree scratch(tree_.allocator());
    SubTree  sub    = single_pane(scratch, 3);
    std::string before = tree_.serialize();
    EXPECT_FALSE(tree_.insert_subtree(sub, InsertionPoint{sub.root, TileKind::Tabs, 0}).has_value());
    EXPECT_FALSE(sub.empty());
    EXPECT_EQ(tree_.serialize(), before);
}

TEST_F(DockTreeTest, InsertRemapsCollidingIds)
{
    // Unreserved extraction keeps ids, so inserting a copy collides.
    DockTree copy = tree_;
    SubTree  sub  = *copy.extract_subtree(a_, false);
    auto     id   = tree_.insert_subtree(sub, InsertionPoint{b_, TileKind::Horizontal, INSERT_AT_END});
    ASSERT_TRUE(id.has_value());
    EXPECT_NE(*id, a_);
    EXPECT_EQ(tree_.pane_count(), 3u);
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

// ─── Structural safety ───────────────────────────────────────────────────────

TEST(DockTreeSafety, WouldSelfParent)
{
    DockTree tree;
    TileId   p1 = tree.add_pane(1);
    TileId   p2 = tree.add_pane(2);
    TileId   p3 = tree.add_pane(3);
    TileId   v  = tree.add_container(TileKind::Vertical, {p2, p3});
    tree.set_root(tree.add_container(TileKind::Horizontal, {p1, v}));

    auto dragged = tree.subtree_ids(v);
    EXPECT_TRUE(tree.would_self_parent(p2, dragged));
    EXPECT_TRUE(tree.would_self_parent(v, dragged));
    EXPECT_FALSE(tree.would_self_parent(p1, dragged));
    EXPECT_TRUE(tree.is_descendant_or_self(v, p3));
    EXPECT_FALSE(tree.is_descendant_or_self(p3, v));
}

TEST(DockTreeSafety, MoveUnderItselfLeavesTreeUnchanged)
{
    DockTree tree;
    TileId   p1 = tree.add_pane(1);
    TileId   p2 = tree.add_pane(2);
    TileId   p3 = tree.add_pane(3);
    TileId   v  = tree.add_container(TileKind::Vertical, {p2, p3});
    tree.set_root(tree.add_container(TileKind::Horizontal, {p1, v}));

    std::string before = tree.serialize();
    EXPECT_FALSE(tree.move_within(v, InsertionPoint{p2, TileKind::Tabs, INSERT_AT_END}));
    EXPECT_EQ(tree.serialize(), before);
}

TEST_F(DockTreeTest, MoveWithinReorders)
{
    EXPECT_TRUE(tree_.move_within(a_, InsertionPoint{b_, TileKind::Horizontal, INSERT_AT_END}));
    EXPECT_EQ(panes(), (std::vector<PaneId>{2, 1}));
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

TEST_F(DockTreeTest, MoveToCollapsingParentTargetsSurvivor)
{
    // The split collapses once `a` leaves; `b` takes its place.
    EXPECT_TRUE(tree_.move_within(a_, InsertionPoint{split_, TileKind::Vertical, INSERT_AT_END}));
    auto root = tree_.root();
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(tree_.get(*root)->kind, TileKind::Vertical);
    EXPECT_EQ(panes(), (std::vector<PaneId>{2, 1}));
    EXPECT_TRUE(tree_.integrity_issues().empty());
}

// Tabs[1, 2, 3] laid out so tab centres sit at x = 70, 210, 350.
static DockTree three_tabs(TileId* tabs_out = nullptr)
{
    DockTree tree;
    TileId   tabs = tree.add_container(TileKind::Tabs, {tree.add_pane(1), tree.add_pane(2), tree.add_pane(3)});
    tree.set_root(tabs);
    tree.layout(Rect{0, 0, 800, 600}, 24.0f);
    if (tabs_out)
        *tabs_out = tabs;
    return tree;
}

static std::vector<PaneId> pane_order(const DockTree& tree)
{
    std::vector<PaneId> out;
    for (TileId id : tree.pane_tiles())
        out.push_back(tree.get(id)->pane);
    return out;
}

TEST(DockTreeReorder, TabMovedRightLandsInHoveredGap)
{
    TileId   tabs = INVALID_TILE_ID;
    DockTree tree = three_tabs(&tabs);

    // Between the centres of tabs 2 and 3.
    auto zone = tree.dock_zone_at({250, 10});
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->insertion, (InsertionPoint{tabs, TileKind::Tabs, 2}));

    EXPECT_TRUE(tree.move_within(*tree.find_pane(1), zone->insertion));
    EXPECT_EQ(pane_order(tree), (std::vector<PaneId>{2, 1, 3}));
    EXPECT_TRUE(tree.integrity_issues().empty());
}

TEST(DockTreeReorder, TabMovedLeftAndToEnd)
{
    TileId   tabs = INVALID_TILE_ID;
    DockTree tree = three_tabs(&tabs);

    EXPECT_TRUE(tree.move_within(*tree.find_pane(3), InsertionPoint{tabs, TileKind::Tabs, 0}));
    EXPECT_EQ(pane_order(tree), (std::vector<PaneId>{3, 1, 2}));

    EXPECT_TRUE(tree.move_within(*tree.find_pane(3), InsertionPoint{tabs, TileKind::Tabs, INSERT_AT_END}));
    EXPECT_EQ(pane_order(tree), (std::vector<PaneId>{1, 2, 3}));

    // Dropping a tab into the gap on either side of itself changes nothing.
    EXPECT_TRUE(tree.move_within(*tree.find_pane(2), InsertionPoint{tabs, TileKind::Tabs, 1}));
    EXPECT_TRUE(tree.move_within(*tree.find_pane(2), InsertionPoint{tabs, TileKind::Tabs, 2}));
    EXPECT_EQ(pane_order(tree), (std::vector<PaneId>{1, 2, 3}));
}

TEST(DockTreeReorder, SplitChildMovedRight)
{
    DockTree tree;
    TileId   a     = tree.add_pane(1);
    TileId   split = tree.add_container(TileKind::Horizontal, {a, tree.add_pane(2), tree.add_pane(3)});
    tree.set_root(split);

    EXPECT_TRUE(tree.move_within(a, InsertionPoint{split, TileKind::Horizontal, 2}));
    EXPECT_EQ(pane_order(tree), (std::vector<PaneId>{2, 1, 3}));
    EXPECT_EQ(tree.get(*tree.root())->children.size(), 3u);
}

// ─── Randomized sequences ────────────────────────────────────────────────────

TEST(DockTreeRandomized, TabReorderMatchesGapModel)
{
    std::mt19937 rng(20260418u);
    for (int round = 0; round < 200; ++round)
    {
        DockTree            tree;
        std::vector<TileId> children;
        for (PaneId p = 1; p <= 5; ++p)
            children.push_back(tree.add_pane(p));
        TileId tabs = tree.add_container(TileKind::Tabs, children);
        tree.set_root(tabs);

        std::vector<PaneId> model{1, 2, 3, 4, 5};
        for (int step = 0; step < 10; ++step)
        {
            size_t from = std::uniform_int_distribution<size_t>(0, 4)(rng);
            size_t gap  = std::uniform_int_distribution<size_t>(0, 5)(rng);
            TileId tile = tree.get(tabs)->children[from];

            ASSERT_TRUE(tree.move_within(tile, InsertionPoint{tabs, TileKind::Tabs, gap}));

            PaneId moved = model[from];
            model.erase(model.begin() + static_cast<std::ptrdiff_t>(from));
            size_t to = from < gap ? gap - 1 : gap;
            model.insert(model.begin() + static_cast<std::ptrdiff_t>(to), moved);

            ASSERT_EQ(pane_order(tree), model) << "round " << round << " step " << step;
            ASSERT_EQ(tree.get(tabs)->active, tile);
        }
    }
}

TEST(DockTreeRandomized, InvariantsHoldOverExtractInsertSequences)
{
    const std::vector<TileKind> kinds{TileKind::Tabs, TileKind::Horizontal, TileKind::Vertical};
    std::mt19937                rng(7u);

    auto pick = [&](const std::vector<TileId>& ids)
    { return ids[std::uniform_int_distribution<size_t>(0, ids.size() - 1)(rng)]; };
    auto random_point = [&](const DockTree& tree) -> InsertionPoint
    {
        std::vector<TileId> ids;
        for (const auto& [id, tile] : tree.tiles())
            ids.push_back(id);
        size_t index = std::uniform_int_distribution<size_t>(0, 4)(rng);
        return InsertionPoint{pick(ids), kinds[std::uniform_int_distribution<size_t>(0, 2)(rng)],
                              index == 4 ? INSERT_AT_END : index};
    };

    for (int round = 0; round < 50; ++round)
    {
        DockTree            tree;
        std::vector<TileId> panes;
        for (PaneId p = 1; p <= 6; ++p)
            panes.push_back(tree.add_pane(p));
        TileId left  = tree.add_container(TileKind::Tabs, {panes[0], panes[1], panes[2]});
        TileId right = tree.add_container(TileKind::Vertical, {panes[3], panes[4], panes[5]});
        tree.set_root(tree.add_container(TileKind::Horizontal, {left, right}));

        for (int step = 0; step < 40; ++step)
        {
            std::vector<TileId> ids;
            for (const auto& [id, tile] : tree.tiles())
                ids.push_back(id);
            TileId tile = pick(ids);

            if (std::uniform_int_distribution<int>(0, 1)(rng) == 0)
            {
                // Same-parent moves are where sibling indices shift.
                InsertionPoint at = random_point(tree);
                if (auto parent = tree.parent_of(tile); parent && step % 3 == 0)
                    at = InsertionPoint{*parent, tree.get(*parent)->kind, at.index};
                const std::string before = tree.serialize();
                if (!tree.move_within(tile, at))
                    ASSERT_EQ(tree.serialize(), before);
            }
            else
            {
                bool reserve = std::uniform_int_distribution<int>(0, 1)(rng) == 1;
                auto sub     = tree.extract_subtree(tile, reserve);
                ASSERT_TRUE(sub.has_value());
                std::optional<InsertionPoint> at;
                if (!tree.is_empty())
                    at = random_point(tree);
                if (!tree.insert_subtree(*sub, at))
                    ASSERT_TRUE(tree.insert_subtree(*sub, std::nullopt).has_value());
            }

            auto issues = tree.integrity_issues();
            ASSERT_TRUE(issues.empty()) << "round " << round << " step " << step << ": " << issues.front();
            ASSERT_EQ(tree.pane_count(), 6u);
        }
    }
}

TEST(DockTreeSafety, IntegrityReportsCorruption)
{
    SubTree bad;
    bad.root     = 10;
    bad.tiles[10] = Tile{.kind = TileKind::Tabs, .children = {11}, .active = 12};
    bad.tiles[13] = Tile{.kind = TileKind::Pane, .pane = 4};
    DockTree tree = DockTree::from_subtree(bad, nullptr);

    auto issues = tree.integrity_issues();
    EXPECT_GE(issues.size(), 3u);   // missing child, foreign active tab, orphan
}

// ─── Layout ──────────────────────────────────────────────────────────────────

TEST_F(DockTreeTest, SplitLayoutDividesEvenly)
{
    EXPECT_EQ(tree_.tile_rect(a_), (Rect{0, 0, 400, 600}));
    EXPECT_EQ(tree_.tile_rect(b_), (Rect{400, 0, 400, 600}));
    EXPECT_EQ(tree_.tile_at({500, 100}), b_);
}

TEST(DockTreeLayout, TabsShowOnlyActiveChild)
{
    DockTree tree;
    TileId   p1   = tree.add_pane(1);
    TileId   p2   = tree.add_pane(2);
    TileId   tabs = tree.add_container(TileKind::Tabs, {p1, p2});
    tree.set_root(tabs);
    tree.layout(Rect{0, 0, 300, 200}, 24.0f);

    EXPECT_EQ(tree.tab_bar_rect(tabs), (Rect{0, 0, 300, 24}));
    EXPECT_EQ(tree.tab_button_rect(p2), (Rect{140, 0, 140, 24}));
    EXPECT_EQ(tree.tile_rect(p1), (Rect{0, 24, 300, 176}));
    EXPECT_FALSE(tree.tile_rect(p2).has_value());
    EXPECT_EQ(tree.tab_insertion_index(tabs, 10.0f), 0u);
    EXPECT_EQ(tree.tab_insertion_index(tabs, 250.0f), 2u);
}

// ─── Drop zones ──────────────────────────────────────────────────────────────

TEST_F(DockTreeTest, DockZoneEdgeAndCenter)
{
    auto left = tree_.dock_zone_at({20, 300});
    ASSERT_TRUE(left.has_value());
    EXPECT_EQ(left->insertion, (InsertionPoint{a_, TileKind::Horizontal, 0}));
    EXPECT_EQ(left->preview, (Rect{0, 0, 200, 600}));

    auto center = tree_.dock_zone_at({200, 300});
    ASSERT_TRUE(center.has_value());
    EXPECT_EQ(center->insertion, (InsertionPoint{a_, TileKind::Tabs, INSERT_AT_END}));

    EXPECT_FALSE(tree_.dock_zone_at({900, 300}).has_value());
}

TEST(DockTreeZones, TabBarZoneInsertsAtIndex)
{
    DockTree tree;
    TileId   p1   = tree.add_pane(1);
    TileId   p2   = tree.add_pane(2);
    TileId   tabs = tree.add_container(TileKind::Tabs, {p1, p2});
    tree.set_root(tabs);
    tree.layout(Rect{0, 0, 300, 200}, 24.0f);

    auto zone = tree.dock_zone_at({160, 10});
    ASSERT_TRUE(zone.has_value());
    EXPECT_EQ(zone->insertion, (InsertionPoint{tabs, TileKind::Tabs, 1}));
    EXPECT_EQ(zone->preview, (Rect{0, 0, 300, 24}));
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(DockTreeSerialize, EqualTreesSerializeIdentically)
{
    auto build = []
    {
        DockTree tree;
        TileId   p1 = tree.add_pane(1);
        TileId   p2 = tree.add_pane(2);
        tree.set_root(tree.add_container(TileKind::Tabs, {p1, p2}));
        return tree.serialize();
    };
    EXPECT_EQ(build(), build());
    EXPECT_NE(build().find("\"kind\":\"tabs\""), std::string::npos);
}
