#include "drop_resolver.hpp"

#include <dockbridge/logger.hpp>

namespace dockbridge
{

const char* drop_phase_name(DropPhase phase)
{
    switch (phase)
    {
        case DropPhase::Idle:
            return "idle";
        case DropPhase::Armed:
            return "armed";
        case DropPhase::LocalResolve:
            return "local-resolve";
        case DropPhase::Deferred:
            return "deferred";
        case DropPhase::RootApply:
            return "root-apply";
        case DropPhase::Terminal:
            return "terminal";
    }
    return "unknown";
}

bool same_outcome(const ResolvedTarget& a, const ResolvedTarget& b)
{
    if (a.has_target() != b.has_target())
        return false;
    if (!a.has_target())
        return true;
    if (a.viewport != b.viewport || a.floating != b.floating)
        return false;
    const auto& da = a.decision;
    const auto& db = b.decision;
    if (da.authority != db.authority)
        return false;
    if (da.authority == Authority::Tree)
        return da.tree_zone->insertion == db.tree_zone->insertion;
    return da.into_empty_tree == db.into_empty_tree && da.insertion_final == db.insertion_final;
}

DropResolver::DropResolver(const DockModel&       model,
                           const GeometryCache&   geometry,
                           const AuthorityPolicy& policy)
    : model_(&model), geometry_(&geometry), policy_(&policy)
{
}

ResolvedTarget DropResolver::resolve_target(const DragPayload& payload, const PointerState& pointer) const
{
    ResolvedTarget r;
    if (!pointer.global)
        return r;

    const bool window_move = payload.is_window_move();

    // A native window being moved is under the pointer; look through it.
    std::optional<ViewportId> exclude;
    if (payload.source_host() == SourceHost::NativeViewport)
        exclude = payload.source_viewport;

    std::optional<ViewportId> viewport;
    if (pointer.hovered && pointer.hovered != exclude && model_->has_viewport(*pointer.hovered))
        viewport = pointer.hovered;
    else
        viewport = geometry_->viewport_at_global(*pointer.global, exclude);
    if (!viewport)
        return r;

    const ViewportGeometry* geom  = geometry_->viewport(*viewport);
    auto                    local = geometry_->to_local(*viewport, *pointer.global);
    if (!geom || !local)
        return r;

    r.viewport      = viewport;
    r.pointer_local = *local;

    std::optional<FloatingId> exclude_floating;
    if (window_move && payload.source_floating && payload.source_viewport == *viewport)
        exclude_floating = payload.source_floating;
    r.floating = geometry_->rect_at_excluding(*viewport, *local, exclude_floating);

    r.surface_rect = geom->dock_rect;
    if (r.floating)
    {
        if (const FloatingRect* fr = geometry_->floating(*viewport, *r.floating))
            r.surface_rect = fr->content;
    }

    const DockTree* tree = model_->tree(r.tree());
    if (!tree)
        return r;

    const TreeRef source{payload.source_viewport, payload.source_floating};
    if (window_move)
    {
        // A window never docks into itself.
        if (r.tree() == source)
            return r;
        r.kind = DragKind::WindowMove;
    }
    else
    {
        r.kind = r.tree() == source ? DragKind::InternalSubtree : DragKind::ExternalSubtree;
    }

    r.decision =
        policy_->decide(*tree, r.surface_rect, *local, r.kind, payload.tile_id, pointer.modifiers);
    return r;
}

// ─── Protocol ────────────────────────────────────────────────────────────────

void DropResolver::arm()
{
    phase_ = DropPhase::Armed;
    pending_.reset();
    last_preview_.reset();
}

DropPhase DropResolver::route_release(ViewportId            delivered_to,
                                      const ResolvedTarget& target,
                                      const PointerState&   pointer,
                                      bool                  force_deferred)
{
    const bool hints_agree = !pointer.hovered || *pointer.hovered == delivered_to;
    if (!force_deferred && hints_agree && target.has_target() && target.viewport == delivered_to)
    {
        phase_ = DropPhase::LocalResolve;
    }
    else
    {
        phase_ = DropPhase::Deferred;
        DOCKBRIDGE_LOG_DEBUG(log_category::DROP,
                             "release delivered to viewport {} deferred (hovered {}, target {})",
                             delivered_to,
                             pointer.hovered ? static_cast<int64_t>(*pointer.hovered) : -1,
                             target.viewport ? static_cast<int64_t>(*target.viewport) : -1);
    }
    return phase_;
}

void DropResolver::defer(PendingDrop drop)
{
    if (pending_)
        DOCKBRIDGE_LOG_WARN(log_category::DROP, "pending drop replaced before root apply");
    pending_ = std::move(drop);
    phase_   = DropPhase::Deferred;
}

std::optional<PendingDrop> DropResolver::take_pending()
{
    if (!pending_)
        return std::nullopt;
    phase_ = DropPhase::RootApply;
    auto out = std::move(pending_);
    pending_.reset();
    return out;
}

void DropResolver::finish()
{
    phase_ = DropPhase::Terminal;
    pending_.reset();
}

void DropResolver::reset()
{
    phase_ = DropPhase::Idle;
    pending_.reset();
    last_preview_.reset();
}

void DropResolver::remember_preview(uint64_t              drag_serial,
                                    const PointerState&   pointer,
                                    const ResolvedTarget& target)
{
    last_preview_ = CachedPreview{drag_serial, pointer, target};
}

}   // namespace dockbridge
