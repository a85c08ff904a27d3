#pragma once

#include <cstdint>
#include <dockbridge/fwd.hpp>
#include <dockbridge/options.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "authority_policy.hpp"
#include "diagnostics.hpp"
#include "dock_model.hpp"
#include "drag_session.hpp"
#include "drop_resolver.hpp"
#include "frame_input.hpp"
#include "geometry_cache.hpp"
#include "lifecycle_manager.hpp"
#include "persist/layout_snapshot.hpp"
#include "window_backend.hpp"

namespace dockbridge
{

// What one viewport paints this frame.  Rects are viewport-local.
struct ViewportFrameOutput
{
    ViewportId                    viewport  = ROOT_VIEWPORT_ID;
    Authority                     authority = Authority::None;
    bool                          suppress_tree_preview = false;
    std::optional<FloatingId>     target_floating;   // hovered surface is this floating window
    std::optional<OverlayTargets> overlay;
    std::optional<DockSide>       hovered;
    std::optional<Rect>           preview_rect;        // bridge preview
    std::optional<Rect>           tree_preview_rect;   // the tree's own reorder preview
    std::optional<InsertionPoint> insertion;           // what a release here commits
};

enum class DropOutcomeKind
{
    Docked,            // moved into a tree by the bridge
    Reordered,         // moved within its own tree by the tree's reorder
    TornOffViewport,   // new detached viewport
    TornOffFloating,   // new floating window
    GhostFinalized,    // ghost window kept where it was released
    NoOp,
};

const char* drop_outcome_name(DropOutcomeKind kind);

struct DropOutcome
{
    DropOutcomeKind           kind     = DropOutcomeKind::NoOp;
    DropPhase                 resolved = DropPhase::Idle;   // LocalResolve or RootApply
    MoveStatus                status   = MoveStatus::MissingTarget;
    std::optional<ViewportId> viewport;
    std::optional<FloatingId> floating;
};

struct FrameOutput
{
    uint64_t                         frame = 0;
    std::vector<ViewportFrameOutput> viewports;
    std::optional<DropOutcome>       drop;
    std::vector<LifecycleEvent>      events;
    bool                             drag_active = false;

    const ViewportFrameOutput* viewport(ViewportId id) const;
};

// ─── DockingBridge ───────────────────────────────────────────────────────────
// Context object of one multi-viewport dock: owns the trees, the drag
// session, the pending-drop slot and the geometry cache, and runs one
// frame at a time through run_frame().
//
// Frame order:
//   1. geometry cache rebuild (every viewport, every floating window)
//   2. tree layout
//   3. pointer sampling (hints validated against geometry)
//   4. drag tracking: ghost spawn/upgrade, window following, preview
//   5. viewport passes, root first: local resolve or defer the release
//   6. RootApply: re-resolve the pending drop, apply or tear off
//   7. ghost finalize, session end
//   8. reaping, titles, integrity checks
//
// Usage:
//   DockingBridge bridge(1, options, &backend);
//   bridge.model().root_tree().set_root(...);
//   bridge.begin_tile_drag(ROOT_VIEWPORT_ID, std::nullopt, tile, pointer);
//   auto out = bridge.run_frame(input);   // every UI frame

class DockingBridge
{
   public:
    using TitleProvider = LifecycleManager::TitleProvider;

    DockingBridge(BridgeId id, DockingOptions options, WindowBackend* backend = nullptr);
    ~DockingBridge() = default;

    DockingBridge(const DockingBridge&)            = delete;
    DockingBridge& operator=(const DockingBridge&) = delete;

    BridgeId id() const { return id_; }

    DockModel&            model() { return model_; }
    const DockModel&      model() const { return model_; }
    const DockingOptions& options() const { return options_; }
    const DragSession&    session() const { return session_; }
    const DropResolver&   resolver() const { return resolver_; }
    const GeometryCache&  geometry() const { return geometry_; }
    const DiagnosticsLog& diagnostics() const { return diagnostics_; }
    DiagnosticsLog&       diagnostics() { return diagnostics_; }
    LifecycleManager&     lifecycle() { return lifecycle_; }
    uint64_t              frame() const { return frame_; }

    void set_backend(WindowBackend* backend);
    void set_title_provider(TitleProvider provider);

    // ── Drag start ──────────────────────────────────────────────────────

    // A tile of a viewport tree or of a floating window's tree.
    bool begin_tile_drag(ViewportId                viewport,
                         std::optional<FloatingId> floating,
                         TileId                    tile,
                         const Vec2&               pointer_global);

    // A whole window: a detached viewport (floating == nullopt) or a
    // floating window.
    bool begin_window_drag(ViewportId                viewport,
                           std::optional<FloatingId> floating,
                           const Vec2&               pointer_global);

    // Start a tile drag from the tree's own drag state, if it has one.
    bool adopt_tree_drag(const TreeRef& tree, const Vec2& pointer_global);

    bool begin_drag(const DragPayload& payload, const Vec2& pointer_global);

    // ── Frame ───────────────────────────────────────────────────────────

    FrameOutput run_frame(const FrameInput& input);

    bool ghost_active() const { return ghost_.has_value(); }

    // ── Layout persistence ──────────────────────────────────────────────

    LayoutSnapshot capture_layout(const PaneRegistry& registry) const;

    // Replaces every tree and window.  Refused while a drag is active.
    std::optional<RestoreReport> restore_layout(const LayoutSnapshot& snapshot, const PaneRegistry& registry);

   private:
    struct GhostDrag
    {
        WindowHost host;
    };

    void rebuild_geometry(const FrameInput& input);
    void layout_trees();
    PointerState sample_pointer(const FrameInput& input, const ViewportInput* released);

    void track_drag(const PointerState& pointer, FrameOutput& out);
    void handle_release(const ViewportInput* delivered, PointerState pointer, FrameOutput& out);

    DropOutcome apply_target(const DragPayload& payload, const ResolvedTarget& target, DropPhase phase);
    DropOutcome root_apply(const PendingDrop& pending);
    DropOutcome tear_off(const DragPayload& payload, const PointerState& pointer);

    void maybe_spawn_ghost(const DragPayload& payload, const PointerState& pointer);
    void maybe_upgrade_ghost(const PointerState& pointer);
    void finalize_ghost(FrameOutput& out);
    void move_dragged_window(const DragPayload& payload, const PointerState& pointer);

    void write_preview(const ResolvedTarget& target, FrameOutput& out) const;
    void check_preview(const PointerState& pointer, const ResolvedTarget& target);
    void reconcile(FrameOutput& out);
    void clear_tree_drag_state();

    // Global rect of the dock surface a payload came from.
    std::optional<Rect> source_surface_global(const DragPayload& payload) const;
    bool                force_tear_off(const DragPayload& payload, const Modifiers& modifiers) const;

    void record(DiagnosticKind kind, std::string message);

    BridgeId         id_;
    DockingOptions   options_;
    DockModel        model_;
    GeometryCache    geometry_;
    DragSession      session_;
    AuthorityPolicy  policy_;
    DropResolver     resolver_;
    LifecycleManager lifecycle_;
    DiagnosticsLog   diagnostics_;

    uint64_t                         frame_ = 0;
    std::map<ViewportId, Rect>       dock_rects_;
    std::optional<Vec2>              last_pointer_global_;
    std::optional<std::vector<Rect>> monitors_;
    std::optional<GhostDrag>         ghost_;
    Vec2                             grab_offset_{};
};

}   // namespace dockbridge
