#pragma once

#include <dockbridge/options.hpp>
#include <dockbridge/types.hpp>
#include <optional>

#include "overlay.hpp"
#include "tree/dock_tree.hpp"

namespace dockbridge
{

// Which subsystem owns the preview and the eventual mutation.
enum class Authority
{
    None,     // nothing previews, release is a no-op for this surface
    Tree,     // the dock tree's own reorder handles the drag
    Bridge,   // the bridge's overlay / drop protocol handles it
};

const char* authority_name(Authority authority);

enum class DragKind
{
    WindowMove,        // a whole window (native viewport or floating window)
    ExternalSubtree,   // a subtree hovering a tree other than its own
    InternalSubtree,   // a subtree hovering its own tree
};

// ─── OverlayDecision ─────────────────────────────────────────────────────────
// Outcome of one policy evaluation against one dock surface.  The same
// evaluation drives the preview painted during the drag and the mutation
// applied on release.

struct OverlayDecision
{
    Authority authority = Authority::None;

    // Targets to paint (absent when the bridge paints nothing).
    std::optional<OverlayTargets> paint;
    std::optional<DockSide>       hovered;

    // Insertion from an overlay target hit, after self-parent filtering.
    // Explicit box hits only, except for external subtree drags which also
    // accept the anti-jitter radial test.
    std::optional<InsertionPoint> insertion_explicit;

    // Heuristic or explicit-rect zone (tab bar / title band) used when no
    // overlay target is hit.
    std::optional<DockZone> fallback_zone;

    // What the bridge applies on release.
    std::optional<InsertionPoint> insertion_final;

    // Drop into an empty tree (the subtree becomes its root).
    bool into_empty_tree = false;

    // What the tree applies on release when it is authoritative.
    std::optional<DockZone> tree_zone;

    std::optional<Rect> preview_rect;

    // The tree must not paint its own preview this frame.
    bool suppress_tree_preview = false;

    // Whole-window docking disabled by the modifier gate.
    bool gated = false;

    bool has_bridge_target() const
    {
        return authority == Authority::Bridge && (insertion_final || into_empty_tree);
    }
    bool has_tree_target() const { return authority == Authority::Tree && tree_zone; }
};

// ─── AuthorityPolicy ─────────────────────────────────────────────────────────
// Priority order:
//   1. Cross-tree drags (other viewport, or other surface in the same
//      viewport): the bridge owns the drag.
//   2. Subtree drags over their own tree: the tree owns the drag unless the
//      pointer is on one of the bridge's explicit overlay targets, in which
//      case the bridge takes over and the tree preview is suppressed.
//   3. Whole-window drags: explicit-only.  An overlay target, a target tab
//      bar or the title band of a non-tab tile must be hovered, and the
//      Shift gate must allow docking.

class AuthorityPolicy
{
   public:
    explicit AuthorityPolicy(const DockingOptions& options) : options_(&options) {}

    OverlayDecision decide(const DockTree&       tree,
                           const Rect&           dock_rect,
                           const Vec2&           pointer_local,
                           DragKind              kind,
                           std::optional<TileId> dragged,
                           const Modifiers&      modifiers) const;

    // Tab bar (insertion index from pointer x) or title band of the hovered
    // tile.  Explicit targets of whole-window drags.
    std::optional<DockZone> window_move_zone(const DockTree& tree, const Vec2& pointer_local) const;

   private:
    const DockingOptions* options_;

    // Hovered tile for inner targets.  An internal drag hovering its own
    // dragged tile targets the parent (or the root) instead.
    std::optional<TileId> overlay_tile(const DockTree&       tree,
                                       const Vec2&           pointer_local,
                                       std::optional<TileId> dragged) const;
};

}   // namespace dockbridge
