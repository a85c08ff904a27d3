#pragma once

#include <dockbridge/options.hpp>
#include <dockbridge/types.hpp>
#include <optional>
#include <vector>

#include "tree/dock_tree.hpp"

namespace dockbridge
{

// ─── Overlay targets ─────────────────────────────────────────────────────────
// Explicit docking buttons drawn by the bridge while a drag hovers a dock.
//
//   Inner targets: a cross of square buttons around the center of the hovered
//   tile.  Left/right are omitted on horizontal containers and top/bottom on
//   vertical ones (those splits already exist).
//
//   Outer targets: four buttons near the edges of the whole dock rect, shown
//   while the pointer is inside the outer band.  They split the tree root.

struct OverlayTarget
{
    DockSide side = DockSide::Center;
    Rect     rect{};
};

struct OverlayTargets
{
    bool                       outer = false;
    Rect                       anchor{};   // tile rect (inner) or dock rect (outer)
    std::vector<OverlayTarget> targets;

    // Half of the first target's width; hit slop is derived from it.
    float half_size() const { return targets.empty() ? 0.0f : targets.front().rect.w * 0.5f; }
};

OverlayTargets inner_overlay_targets(const Rect&             tile_rect,
                                     std::optional<TileKind> tile_kind,
                                     const OverlayMetrics&   metrics);

std::optional<OverlayTargets> outer_overlay_targets(const Rect&           dock_rect,
                                                    const OverlayMetrics& metrics);

bool pointer_in_outer_band(const Rect& dock_rect, const Vec2& p, const OverlayMetrics& metrics);

// Boxes expanded by the hit slop.  This is the "explicit hit" test.
std::optional<OverlayTarget> hit_test_boxes(const OverlayTargets& targets,
                                            const Vec2&           p,
                                            const OverlayMetrics& metrics);

// Anti-jitter hit test: a center disc, then side quadrants by dominant axis
// within an outer ring, then the expanded boxes.
std::optional<OverlayTarget> hit_test_radial(const OverlayTargets& targets,
                                             const Vec2&           p,
                                             const OverlayMetrics& metrics);

// Highlight rect for a hovered target.
Rect overlay_preview_rect(const OverlayTargets& targets, DockSide side);

}   // namespace dockbridge
