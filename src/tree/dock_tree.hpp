#pragma once

#include <cstddef>
#include <cstdint>
#include <dockbridge/fwd.hpp>
#include <dockbridge/types.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace dockbridge
{

// ─── Tiles ───────────────────────────────────────────────────────────────────

enum class TileKind
{
    Pane,
    Tabs,
    Horizontal,   // children laid out left to right
    Vertical,     // children laid out top to bottom
};

const char* tile_kind_name(TileKind kind);

// Side of a tile a drop lands on.  Center tabs into the tile.
enum class DockSide
{
    Center,
    Left,
    Right,
    Top,
    Bottom,
};

const char* dock_side_name(DockSide side);

struct Tile
{
    TileKind              kind = TileKind::Pane;
    PaneId                pane = 0;               // Pane only
    std::vector<TileId>   children;               // containers only
    TileId                active = INVALID_TILE_ID;   // Tabs only

    bool is_pane() const { return kind == TileKind::Pane; }
    bool is_container() const { return kind != TileKind::Pane; }
    bool is_linear() const { return kind == TileKind::Horizontal || kind == TileKind::Vertical; }
};

// Where to put a subtree: under `parent`, inside a container of `kind`.  If
// `parent` already is a container of that kind the subtree becomes its child
// at `index`; otherwise `parent` is wrapped into a new container of `kind`.
struct InsertionPoint
{
    TileId   parent = INVALID_TILE_ID;
    TileKind kind   = TileKind::Tabs;
    size_t   index  = INSERT_AT_END;

    bool operator==(const InsertionPoint& o) const
    {
        return parent == o.parent && kind == o.kind && index == o.index;
    }
};

// Heuristic drop target for a point: the rect to highlight and where the
// subtree would go.
struct DockZone
{
    Rect           preview{};
    InsertionPoint insertion;
};

InsertionPoint insertion_for_side(TileId tile, DockSide side);

// Half of `tile_rect` on the given side (the whole rect for Center).
Rect side_preview_rect(const Rect& tile_rect, DockSide side);

// A tile with all of its descendants, detached from any tree.
struct SubTree
{
    TileId                 root = INVALID_TILE_ID;
    std::map<TileId, Tile> tiles;

    bool empty() const { return tiles.empty(); }
    std::unordered_set<TileId> ids() const;
};

// ─── TileIdAllocator ─────────────────────────────────────────────────────────
// Hands out tile ids for every tree of one bridge.  Ids are never reused.

class TileIdAllocator
{
   public:
    TileId allocate() { return next_++; }

    // Reserve `count` consecutive ids; returns the first one.
    TileId reserve_block(size_t count)
    {
        TileId first = next_;
        next_ += count;
        return first;
    }

    // Make sure ids created elsewhere (restored layouts) are never handed out.
    void observe(TileId id)
    {
        if (id >= next_)
            next_ = id + 1;
    }

    TileId peek_next() const { return next_; }

   private:
    TileId next_ = 1;
};

// ─── DockTree ────────────────────────────────────────────────────────────────
// Hierarchical dock layout: panes grouped by tab and split containers.
//
// Invariants (checked by integrity_issues()):
//   - every tile reachable from the root is reachable exactly once
//   - every tile in the map is reachable (no orphans)
//   - a Tabs container's active tile is one of its children
//
// Mutations keep the tree normalized: empty containers are removed, linear
// containers left with a single child are replaced by that child, and a linear
// child of the same direction is spliced into its parent.

class DockTree
{
   public:
    explicit DockTree(std::shared_ptr<TileIdAllocator> allocator = nullptr);
    ~DockTree() = default;

    DockTree(const DockTree&)            = default;
    DockTree& operator=(const DockTree&) = default;
    DockTree(DockTree&&)                 = default;
    DockTree& operator=(DockTree&&)      = default;

    // ── Building ────────────────────────────────────────────────────────

    // Create an unattached pane / container tile.  Attach with set_root()
    // or as a child of another container.
    TileId add_pane(PaneId pane);
    TileId add_container(TileKind kind, std::vector<TileId> children);

    void set_root(TileId id);
    void clear();

    // Tree with a single subtree as root.  Ids are kept; the allocator
    // observes them.
    static DockTree from_subtree(SubTree subtree, std::shared_ptr<TileIdAllocator> allocator);

    // ── Queries ─────────────────────────────────────────────────────────

    std::optional<TileId> root() const { return root_; }
    bool                  is_empty() const { return !root_.has_value(); }
    bool                  contains(TileId id) const { return tiles_.count(id) > 0; }
    const Tile*           get(TileId id) const;
    std::optional<TileId> parent_of(TileId id) const;

    const std::map<TileId, Tile>& tiles() const { return tiles_; }
    size_t                        tile_count() const { return tiles_.size(); }

    // Panes in depth-first order.
    std::vector<TileId>   pane_tiles() const;
    size_t                pane_count() const { return pane_tiles().size(); }
    std::optional<TileId> find_pane(PaneId pane) const;
    std::optional<PaneId> first_pane() const;

    // Ids of `id` and all of its descendants (empty if `id` is unknown).
    std::unordered_set<TileId> subtree_ids(TileId id) const;

    // True if `candidate` is `ancestor` or lies below it.
    bool is_descendant_or_self(TileId ancestor, TileId candidate) const;

    // True if placing a subtree under `target_parent` would make the subtree
    // its own ancestor: the target or one of its ancestors (walked to the
    // root) belongs to `dragged`.
    bool would_self_parent(TileId target_parent, const std::unordered_set<TileId>& dragged) const;

    bool set_active_tab(TileId tabs, TileId child);

    const std::shared_ptr<TileIdAllocator>& allocator() const { return allocator_; }

    // ── Subtree transfer ────────────────────────────────────────────────

    // Remove `id` and its descendants.  With reserve_ids the subtree is
    // re-keyed into a freshly reserved id block (it is leaving this tree and
    // its old ids are retired); same-tree reorders pass false so no id
    // space is consumed.
    std::optional<SubTree> extract_subtree(TileId id, bool reserve_ids);

    // Insert a subtree.  On success the subtree is consumed and the id of its
    // (possibly remapped) root tile is returned.  Returns nullopt, leaving
    // the subtree untouched, when the target parent is missing or belongs to
    // the subtree.
    std::optional<TileId> insert_subtree(SubTree&                             subtree,
                                         const std::optional<InsertionPoint>& at);

    // Same-tree reorder used when the tree handles a drag itself.  The tree is
    // unchanged when the move is rejected.
    bool move_within(TileId id, const InsertionPoint& at);

    void set_allow_container_tabbing(bool allow) { allow_container_tabbing_ = allow; }

    // ── Layout ──────────────────────────────────────────────────────────

    // Assign rects to every visible tile.  Only the active child of a tab
    // group is visible.
    void layout(const Rect& bounds, float tab_bar_height);

    std::optional<Rect>   tile_rect(TileId id) const;
    std::optional<Rect>   tab_bar_rect(TileId tabs) const;
    std::optional<Rect>   tab_button_rect(TileId child) const;
    size_t                tab_insertion_index(TileId tabs, float x) const;
    std::vector<TileId>   visible_tiles() const;
    std::optional<TileId> tabs_with_bar_at(const Vec2& p) const;
    const Rect&           bounds() const { return bounds_; }
    float                 tab_bar_height() const { return tab_bar_height_; }

    // Smallest visible tile containing p.
    std::optional<TileId> tile_at(const Vec2& p) const;

    // ── Drag integration ────────────────────────────────────────────────

    // Nearest-zone heuristic drop target for p (tab bar ⇒ tab insertion,
    // pane edge band ⇒ split, pane center ⇒ tab).
    std::optional<DockZone> dock_zone_at(const Vec2& p) const;

    // The tile the tree's own UI is dragging, if any.
    std::optional<TileId> dragged_tile_id() const { return dragged_tile_; }
    void                  set_dragged_tile(std::optional<TileId> id) { dragged_tile_ = id; }

    // ── Diagnostics ─────────────────────────────────────────────────────

    std::vector<std::string> integrity_issues() const;

    // Canonical text form; equal trees serialize identically.
    std::string serialize() const;

    // Split edge band of a tile rect used by dock_zone_at.
    static constexpr float DROP_ZONE_FRACTION = 0.25f;
    static constexpr float DROP_ZONE_MIN_SIZE = 40.0f;
    static constexpr float DROP_ZONE_MAX_FRACTION = 0.4f;
    static constexpr float TAB_MAX_WIDTH = 140.0f;

   private:
    std::shared_ptr<TileIdAllocator> allocator_;
    std::map<TileId, Tile>           tiles_;
    std::optional<TileId>            root_;
    std::optional<TileId>            dragged_tile_;
    bool                             allow_container_tabbing_ = false;

    // Layout results
    Rect                   bounds_{};
    float                  tab_bar_height_ = 0.0f;
    std::map<TileId, Rect> rects_;
    std::map<TileId, Rect> tab_bars_;
    std::map<TileId, Rect> tab_buttons_;

    void layout_tile(TileId id, const Rect& rect);
    void replace_child(std::optional<TileId> parent, TileId old_child, TileId new_child);
    void detach_from_parent(TileId id);
    void normalize_after_removal(TileId container);
    void splice_same_direction(TileId container);
    void remap_colliding_ids(SubTree& subtree);
    TileId attach(SubTree& subtree, const InsertionPoint& at);
    void collect_ids(TileId id, std::vector<TileId>& out) const;
};

}   // namespace dockbridge
