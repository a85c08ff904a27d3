#pragma once

#include <cstdint>
#include <dockbridge/fwd.hpp>
#include <dockbridge/options.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <variant>
#include <vector>

#include "drag_session.hpp"
#include "floating_manager.hpp"
#include "tree/dock_tree.hpp"
#include "window_backend.hpp"

namespace dockbridge
{

// A detached viewport and the tree it owns.
struct DetachedDock
{
    ViewportId        viewport = 0;
    uint64_t          serial   = 0;
    DockTree          tree;
    ViewportPlacement placement;
};

// Identifies one tree: a viewport's dock tree, or a floating window's tree.
struct TreeRef
{
    ViewportId                viewport = ROOT_VIEWPORT_ID;
    std::optional<FloatingId> floating;

    bool operator==(const TreeRef& o) const
    {
        return viewport == o.viewport && floating == o.floating;
    }
};

// ─── WindowHost ──────────────────────────────────────────────────────────────
// Where dragged content currently lives.

struct DockedHost
{
    ViewportId viewport = ROOT_VIEWPORT_ID;   // root or detached tree
    TileId     tile     = INVALID_TILE_ID;
};

struct FloatingHost
{
    ViewportId            viewport = ROOT_VIEWPORT_ID;
    FloatingId            floating = 0;
    std::optional<TileId> tile;   // nullopt: the whole window
};

struct DetachedHost
{
    ViewportId viewport = 0;   // the whole detached viewport
};

using WindowHost = std::variant<DockedHost, FloatingHost, DetachedHost>;

std::optional<WindowHost> host_from_payload(const DragPayload& payload);

// Destination of a move: a tree and an insertion point in it (nullopt: the
// tree is empty and the content becomes its root).
struct DropDestination
{
    TreeRef                       tree;
    std::optional<InsertionPoint> insertion;
};

enum class MoveStatus
{
    Applied,
    MissingTarget,         // destination tree or parent does not exist
    StructuralViolation,   // would self-parent or break tree invariants
    SourceMissing,         // dragged content no longer exists
};

const char* move_status_name(MoveStatus status);

struct MoveResult
{
    MoveStatus status   = MoveStatus::MissingTarget;
    TileId     new_root = INVALID_TILE_ID;

    bool applied() const { return status == MoveStatus::Applied; }
};

// ─── DockModel ───────────────────────────────────────────────────────────────
// Every tree of one bridge: the root tree, one tree per detached viewport,
// and one tree per floating window.  All trees share one TileIdAllocator.

class DockModel
{
   public:
    explicit DockModel(const DockingOptions& options);
    ~DockModel() = default;

    DockModel(const DockModel&)            = delete;
    DockModel& operator=(const DockModel&) = delete;

    // ── Trees ───────────────────────────────────────────────────────────

    DockTree&       root_tree() { return root_; }
    const DockTree& root_tree() const { return root_; }

    // Replace the root tree (layout restore).
    void replace_root(DockTree tree);

    DockTree*       tree(const TreeRef& ref);
    const DockTree* tree(const TreeRef& ref) const;

    // A new empty tree on the shared allocator.
    DockTree make_tree() const;

    const std::shared_ptr<TileIdAllocator>& allocator() const { return allocator_; }

    // ── Viewports ───────────────────────────────────────────────────────

    bool                    has_viewport(ViewportId id) const;
    std::vector<ViewportId> viewport_ids() const;   // root first, then ascending

    DetachedDock*                               detached(ViewportId id);
    const DetachedDock*                         detached(ViewportId id) const;
    const std::map<ViewportId, DetachedDock>&   detached_docks() const { return detached_; }

    ViewportId add_detached(DockTree tree, ViewportPlacement placement);
    bool       remove_detached(ViewportId id);

    // Restore a detached viewport under a known id / serial.
    bool restore_detached(ViewportId id, uint64_t serial, DockTree tree, ViewportPlacement placement);

    // ── Floating windows ────────────────────────────────────────────────

    FloatingManager&       floating(ViewportId viewport) { return floating_[viewport]; }
    const FloatingManager* floating_if(ViewportId viewport) const;
    const std::map<ViewportId, FloatingManager>& floating_managers() const { return floating_; }
    FloatingWindow*        floating_window(ViewportId viewport, FloatingId id);

    FloatingId add_floating(ViewportId viewport, DockTree tree, const Vec2& offset, const Vec2& size);
    bool       remove_floating(ViewportId viewport, FloatingId id);
    bool       restore_floating(ViewportId viewport,
                                FloatingId id,
                                DockTree   tree,
                                const Vec2& offset,
                                const Vec2& size,
                                bool       collapsed);

    // ── Moves ───────────────────────────────────────────────────────────

    // The tree a host's content lives in.
    std::optional<TreeRef> tree_of(const WindowHost& host) const;

    // Tile ids of the host's content, collected before any extraction.
    std::unordered_set<TileId> host_ids(const WindowHost& host) const;

    // Root tile of the host's content.
    std::optional<TileId> host_tile(const WindowHost& host) const;

    // Move a host's content to a destination.  Either the whole move
    // happens or nothing changes.
    MoveResult move_to(const WindowHost& source, const DropDestination& dest);

    // Remove a host's content from its tree (ids reserved: it is leaving).
    std::optional<SubTree> take_from_host(const WindowHost& host);

    // ── Diagnostics ─────────────────────────────────────────────────────

    // Canonical text of every tree, placement and floating window.
    std::string serialize() const;

    ViewportId next_viewport_id() const { return next_viewport_id_; }
    uint64_t   next_serial() const { return next_serial_; }
    FloatingId next_floating_id() const { return next_floating_id_; }
    void     set_counters(ViewportId next_viewport, uint64_t next_serial, FloatingId next_floating);

    // Drops every tree and window; counters keep increasing.
    void clear();

   private:
    const DockingOptions*                    options_;
    std::shared_ptr<TileIdAllocator>         allocator_;
    DockTree                                 root_;
    std::map<ViewportId, DetachedDock>       detached_;
    std::map<ViewportId, FloatingManager>    floating_;
    ViewportId                               next_viewport_id_ = 1;
    uint64_t                                 next_serial_      = 1;
    FloatingId                               next_floating_id_ = 1;
};

}   // namespace dockbridge
