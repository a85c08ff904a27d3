#pragma once

#include <cstdint>
#include <dockbridge/options.hpp>
#include <optional>

#include "authority_policy.hpp"
#include "dock_model.hpp"
#include "drag_session.hpp"
#include "frame_input.hpp"
#include "geometry_cache.hpp"

namespace dockbridge
{

// Where a release is in the deferred drop protocol.
//
//   Idle ─► Armed ─┬─► LocalResolve ───────────────┐
//                  └─► Deferred ─► RootApply ──────┴─► Terminal
enum class DropPhase
{
    Idle,
    Armed,          // drag active, nothing released yet
    LocalResolve,   // the viewport the release was delivered to applies it
    Deferred,       // recorded for the end-of-frame pass
    RootApply,      // end-of-frame re-resolution and apply
    Terminal,       // consumed; the session ends this frame
};

const char* drop_phase_name(DropPhase phase);

// A release waiting for the end-of-frame pass.
struct PendingDrop
{
    DragPayload               payload;
    std::optional<Vec2>       pointer_global;
    std::optional<ViewportId> hovered;
    Modifiers                 modifiers;
    std::optional<ViewportId> delivered_to;   // nullopt: implicit release

    PointerState pointer() const { return {pointer_global, hovered, modifiers}; }
};

// The surface under the pointer and the policy's decision for it.
struct ResolvedTarget
{
    std::optional<ViewportId> viewport;
    std::optional<FloatingId> floating;
    Vec2                      pointer_local{};
    Rect                      surface_rect{};   // dock rect or floating content rect, local
    DragKind                  kind = DragKind::ExternalSubtree;
    OverlayDecision           decision;

    TreeRef tree() const { return {viewport.value_or(ROOT_VIEWPORT_ID), floating}; }
    bool    has_target() const
    {
        return viewport && (decision.has_bridge_target() || decision.has_tree_target());
    }
};

// Two resolutions lead to the same mutation.
bool same_outcome(const ResolvedTarget& a, const ResolvedTarget& b);

// Decision shown on the last drag frame, kept for the release.
struct CachedPreview
{
    uint64_t       drag_serial = 0;
    PointerState   pointer;
    ResolvedTarget target;
};

// ─── DropResolver ────────────────────────────────────────────────────────────
// Resolves the drop target for a pointer state and carries a release through
// the deferred protocol.  A release is applied in the viewport it was
// delivered to only when the hovered viewport is that viewport; otherwise
// it waits for RootApply, which re-resolves against every viewport once all
// viewport passes of the frame have run.

class DropResolver
{
   public:
    DropResolver(const DockModel& model, const GeometryCache& geometry, const AuthorityPolicy& policy);
    ~DropResolver() = default;

    DropResolver(const DropResolver&)            = delete;
    DropResolver& operator=(const DropResolver&) = delete;

    ResolvedTarget resolve_target(const DragPayload& payload, const PointerState& pointer) const;

    // ── Protocol ────────────────────────────────────────────────────────

    void      arm();
    DropPhase phase() const { return phase_; }

    // LocalResolve or Deferred for a release delivered to `delivered_to`.
    DropPhase route_release(ViewportId             delivered_to,
                            const ResolvedTarget&  target,
                            const PointerState&    pointer,
                            bool                   force_deferred);

    void                       defer(PendingDrop drop);
    bool                       has_pending() const { return pending_.has_value(); }
    const std::optional<PendingDrop>& pending() const { return pending_; }

    // Moves to RootApply and hands the pending drop over.
    std::optional<PendingDrop> take_pending();

    void finish();
    void reset();

    // ── Preview cache ───────────────────────────────────────────────────

    void remember_preview(uint64_t drag_serial, const PointerState& pointer, const ResolvedTarget& target);
    const std::optional<CachedPreview>& last_preview() const { return last_preview_; }

   private:
    const DockModel*       model_;
    const GeometryCache*   geometry_;
    const AuthorityPolicy* policy_;

    DropPhase                    phase_ = DropPhase::Idle;
    std::optional<PendingDrop>   pending_;
    std::optional<CachedPreview> last_preview_;
};

}   // namespace dockbridge
