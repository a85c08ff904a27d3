#pragma once

#include <cstddef>
#include <dockbridge/types.hpp>

namespace dockbridge
{

// How detached viewports are decorated.  OS-decorated windows are moved by
// the window system (native drag-move); client-side-chrome windows are moved
// by the bridge through placement updates.
enum class DecorationMode
{
    OsDecorated,
    ClientSideChrome,
};

// ─── OverlayMetrics ──────────────────────────────────────────────────────────
// Sizes of the explicit docking targets.  Every "size" is
// clamp(min_dim * fraction, min, max) where min_dim is the smaller side of the
// rect the targets are laid out in.

struct OverlayMetrics
{
    // Inner (per-tile) targets
    float inner_size_fraction = 0.16f;
    float inner_size_min      = 24.0f;
    float inner_size_max      = 56.0f;
    float inner_gap_fraction  = 0.25f;   // of the target size
    float inner_gap_min       = 6.0f;
    float inner_gap_max       = 18.0f;

    // Outer (whole-surface) targets
    float outer_band_fraction   = 0.22f;
    float outer_band_min        = 32.0f;
    float outer_band_max        = 80.0f;
    float outer_size_fraction   = 0.12f;
    float outer_size_min        = 22.0f;
    float outer_size_max        = 56.0f;
    float outer_margin_fraction = 0.35f;   // of the target size
    float outer_margin_min      = 6.0f;
    float outer_margin_max      = 18.0f;

    // Hit slop around every target box, as a fraction of the half-size.
    float hit_expand_fraction = 0.30f;

    // Anti-jitter radii (multiples of the half-size) used while the overlay
    // is painted for a drag the bridge already owns.
    float radial_center_factor = 1.4f;
    float radial_side_factor   = 2.6f;
};

// ─── DockingOptions ──────────────────────────────────────────────────────────

struct DockingOptions
{
    // false: Shift disables docking of whole-window drags while held.
    // true:  Shift is required to dock a whole-window drag.
    bool docking_with_shift = false;

    // Distance (px) the release point must lie outside the source dock rect
    // before a subtree drag tears off.
    float tear_off_threshold = 8.0f;

    bool detach_on_alt_release_anywhere = true;
    bool tear_off_to_floating_on_ctrl   = true;
    bool detach_parent_tabs_on_shift    = true;

    // Live tear-off: the torn subtree is spawned as soon as the pointer leaves
    // the dock rect, and the drag continues as a whole-window drag.
    bool ghost_tear_off                            = false;
    bool ghost_spawn_native_on_leave_dock          = true;
    bool ghost_upgrade_to_native_on_leave_viewport = true;

    bool show_outer_overlay_targets = true;

    // Tabbing a container subtree keeps it intact instead of flattening its
    // panes into the target tab group.
    bool allow_container_tabbing = false;

    DecorationMode decoration = DecorationMode::OsDecorated;

    Vec2  default_detached_size{480.0f, 360.0f};
    Vec2  min_detached_size{200.0f, 120.0f};
    Vec2  detached_grab_offset{20.0f, 10.0f};
    float tab_bar_height        = 24.0f;
    float floating_title_height = 22.0f;

    OverlayMetrics overlay;

    bool   debug_event_log          = false;
    size_t debug_event_log_capacity = 200;
    bool   debug_integrity          = false;

    // Whether a whole-window drag may dock with the given Shift state.
    bool docking_enabled(bool shift_held) const { return docking_with_shift == shift_held; }
};

}   // namespace dockbridge
