#include "docking_bridge.hpp"

#include <algorithm>
#include <dockbridge/logger.hpp>

namespace dockbridge
{

const char* drop_outcome_name(DropOutcomeKind kind)
{
    switch (kind)
    {
        case DropOutcomeKind::Docked:
            return "docked";
        case DropOutcomeKind::Reordered:
            return "reordered";
        case DropOutcomeKind::TornOffViewport:
            return "torn-off-viewport";
        case DropOutcomeKind::TornOffFloating:
            return "torn-off-floating";
        case DropOutcomeKind::GhostFinalized:
            return "ghost-finalized";
        case DropOutcomeKind::NoOp:
            return "no-op";
    }
    return "unknown";
}

const ViewportFrameOutput* FrameOutput::viewport(ViewportId id) const
{
    for (const auto& v : viewports)
    {
        if (v.viewport == id)
            return &v;
    }
    return nullptr;
}

DockingBridge::DockingBridge(BridgeId id, DockingOptions options, WindowBackend* backend)
    : id_(id),
      options_(std::move(options)),
      model_(options_),
      session_(id),
      policy_(options_),
      resolver_(model_, geometry_, policy_),
      lifecycle_(options_, model_),
      diagnostics_(options_.debug_event_log_capacity)
{
    lifecycle_.set_backend(backend);
}

void DockingBridge::set_backend(WindowBackend* backend)
{
    lifecycle_.set_backend(backend);
}

void DockingBridge::set_title_provider(TitleProvider provider)
{
    lifecycle_.set_title_provider(std::move(provider));
}

void DockingBridge::record(DiagnosticKind kind, std::string message)
{
    if (options_.debug_event_log)
        diagnostics_.record(frame_, kind, std::move(message));
}

// ─── Drag start ──────────────────────────────────────────────────────────────

bool DockingBridge::begin_tile_drag(ViewportId                viewport,
                                    std::optional<FloatingId> floating,
                                    TileId                    tile,
                                    const Vec2&               pointer_global)
{
    return begin_drag(DragPayload{id_, viewport, floating, tile}, pointer_global);
}

bool DockingBridge::begin_window_drag(ViewportId                viewport,
                                      std::optional<FloatingId> floating,
                                      const Vec2&               pointer_global)
{
    return begin_drag(DragPayload{id_, viewport, floating, std::nullopt}, pointer_global);
}

bool DockingBridge::adopt_tree_drag(const TreeRef& tree, const Vec2& pointer_global)
{
    const DockTree* t = model_.tree(tree);
    if (!t || !t->dragged_tile_id())
        return false;
    return begin_tile_drag(tree.viewport, tree.floating, *t->dragged_tile_id(), pointer_global);
}

bool DockingBridge::begin_drag(const DragPayload& payload, const Vec2& pointer_global)
{
    auto host = host_from_payload(payload);
    if (!host || !model_.host_tile(*host))
    {
        DOCKBRIDGE_LOG_DEBUG(log_category::SESSION,
                             "drag from viewport {} refused: nothing to drag",
                             payload.source_viewport);
        return false;
    }
    if (!session_.begin(payload))
        return false;

    resolver_.arm();
    ghost_.reset();
    grab_offset_         = {};
    last_pointer_global_ = pointer_global;

    if (payload.tile_id)
    {
        if (DockTree* tree = model_.tree({payload.source_viewport, payload.source_floating}))
            tree->set_dragged_tile(payload.tile_id);
    }
    else if (payload.source_floating)
    {
        FloatingWindow* w = model_.floating_window(payload.source_viewport, *payload.source_floating);
        auto            local = geometry_.to_local(payload.source_viewport, pointer_global);
        if (w && local)
            grab_offset_ = *local - w->offset;
        model_.floating(payload.source_viewport).bring_to_front(*payload.source_floating);
    }
    else if (const DetachedDock* dock = model_.detached(payload.source_viewport))
    {
        grab_offset_ = pointer_global - dock->placement.position;
        if (dock->placement.decoration == DecorationMode::OsDecorated)
            lifecycle_.begin_native_move(payload.source_viewport);
    }

    DOCKBRIDGE_LOG_INFO(log_category::SESSION,
                        "drag {} started from viewport {} ({})",
                        session_.serial(),
                        payload.source_viewport,
                        payload.is_window_move() ? "window" : "tile");
    return true;
}

// ─── Frame ───────────────────────────────────────────────────────────────────

FrameOutput DockingBridge::run_frame(const FrameInput& input)
{
    ++frame_;
    ScopedLogContext log_context(id_, frame_);
    FrameOutput      out;
    out.frame = frame_;
    if (input.hints.monitors)
        monitors_ = input.hints.monitors;

    rebuild_geometry(input);
    layout_trees();

    // Root first: viewport ids ascend from the root.
    const ViewportInput* released = nullptr;
    bool                 any_down = false;
    for (const auto& vi : input.viewports)
    {
        if (!model_.has_viewport(vi.viewport))
            continue;
        any_down = any_down || vi.primary_down;
        if (vi.primary_released && (!released || vi.viewport < released->viewport))
            released = &vi;
    }

    for (ViewportId id : model_.viewport_ids())
        out.viewports.push_back(ViewportFrameOutput{.viewport = id});

    PointerState pointer = sample_pointer(input, released);

    if (session_.is_active())
    {
        if (released || !any_down)
        {
            if (!released)
                DOCKBRIDGE_LOG_DEBUG(log_category::DROP, "no viewport holds the button; implicit release");
            handle_release(released, pointer, out);
        }
        else
        {
            track_drag(pointer, out);
        }
    }

    reconcile(out);
    out.drag_active = session_.is_active();
    return out;
}

void DockingBridge::rebuild_geometry(const FrameInput& input)
{
    geometry_.begin_rebuild(frame_);
    for (ViewportId id : model_.viewport_ids())
    {
        const ViewportInput* in = nullptr;
        for (const auto& vi : input.viewports)
        {
            if (vi.viewport == id)
                in = &vi;
        }

        ViewportGeometry g;
        if (in && in->inner_rect)
            g.inner_rect = in->inner_rect;
        else if (auto last = geometry_.last_known_inner_rect(id))
            g.inner_rect = last;
        else if (const DetachedDock* dock = model_.detached(id))
            g.inner_rect = Rect{dock->placement.position.x,
                                dock->placement.position.y,
                                dock->placement.size.x,
                                dock->placement.size.y};

        if (in && in->dock_rect)
            g.dock_rect = *in->dock_rect;
        else if (g.inner_rect)
            g.dock_rect = Rect{0.0f, 0.0f, g.inner_rect->w, g.inner_rect->h};
        else if (auto it = dock_rects_.find(id); it != dock_rects_.end())
            g.dock_rect = it->second;
        dock_rects_[id] = g.dock_rect;

        if (const FloatingManager* fm = model_.floating_if(id))
            g.floating = fm->hit_rects(options_.floating_title_height);

        geometry_.set_viewport(id, std::move(g));
    }
    geometry_.seal();
}

void DockingBridge::layout_trees()
{
    for (ViewportId id : model_.viewport_ids())
    {
        if (DockTree* tree = model_.tree({id, std::nullopt}))
            tree->layout(dock_rects_[id], options_.tab_bar_height);
    }

    std::vector<ViewportId> with_floating;
    for (const auto& [id, fm] : model_.floating_managers())
        with_floating.push_back(id);
    for (ViewportId id : with_floating)
        model_.floating(id).layout(options_.floating_title_height, options_.tab_bar_height);
}

PointerState DockingBridge::sample_pointer(const FrameInput& input, const ViewportInput* released)
{
    PointerState p;

    if (released)
        p.modifiers = released->modifiers;
    else
    {
        auto held = std::find_if(input.viewports.begin(),
                                 input.viewports.end(),
                                 [](const ViewportInput& vi) { return vi.primary_down; });
        if (held != input.viewports.end())
            p.modifiers = held->modifiers;
        else if (!input.viewports.empty())
            p.modifiers = input.viewports.front().modifiers;
    }

    if (input.hints.pointer_global)
    {
        p.global = input.hints.pointer_global;
    }
    else
    {
        // Local pointer plus the viewport's last known screen offset.
        auto from_local = [this](const ViewportInput& vi) -> std::optional<Vec2>
        {
            if (!vi.pointer_local)
                return std::nullopt;
            auto inner = vi.inner_rect ? vi.inner_rect : geometry_.last_known_inner_rect(vi.viewport);
            if (!inner)
                return std::nullopt;
            return inner->min() + *vi.pointer_local;
        };

        if (released)
            p.global = from_local(*released);
        for (const auto& vi : input.viewports)
        {
            if (!p.global && vi.primary_down)
                p.global = from_local(vi);
        }
        for (const auto& vi : input.viewports)
        {
            if (!p.global)
                p.global = from_local(vi);
        }
    }

    if (auto hovered = input.hints.hovered_viewport)
    {
        bool stale = !model_.has_viewport(*hovered);
        if (!stale && p.global)
        {
            const ViewportGeometry* g = geometry_.viewport(*hovered);
            stale = !g || !g->inner_rect || !g->inner_rect->contains(*p.global);
        }
        if (stale)
        {
            DOCKBRIDGE_LOG_WARN(log_category::DROP,
                                "hovered-viewport hint {} contradicts geometry; using geometry",
                                *hovered);
            record(DiagnosticKind::StaleHint,
                   "hovered hint " + std::to_string(*hovered) + " contradicts geometry");
        }
        else
        {
            p.hovered = hovered;
        }
    }

    if (p.global)
        last_pointer_global_ = p.global;
    return p;
}

// ─── Drag tracking ───────────────────────────────────────────────────────────

void DockingBridge::track_drag(const PointerState& pointer, FrameOutput& out)
{
    const DragPayload payload = *session_.payload();
    if (options_.ghost_tear_off && !ghost_ && !payload.is_window_move())
        maybe_spawn_ghost(payload, pointer);
    if (ghost_)
        maybe_upgrade_ghost(pointer);

    const DragPayload& current = *session_.payload();
    move_dragged_window(current, pointer);

    ResolvedTarget target = resolver_.resolve_target(current, pointer);
    resolver_.remember_preview(session_.serial(), pointer, target);
    write_preview(target, out);
}

void DockingBridge::move_dragged_window(const DragPayload& payload, const PointerState& pointer)
{
    if (!payload.is_window_move() || !pointer.global)
        return;

    if (payload.source_floating)
    {
        FloatingWindow* w = model_.floating_window(payload.source_viewport, *payload.source_floating);
        auto            local = geometry_.to_local(payload.source_viewport, *pointer.global);
        if (w && local)
            w->offset = *local - grab_offset_;
        return;
    }

    // OS-decorated windows were handed to the window system at drag start.
    const DetachedDock* dock = model_.detached(payload.source_viewport);
    if (dock && dock->placement.decoration == DecorationMode::ClientSideChrome)
        lifecycle_.move_viewport(payload.source_viewport, *pointer.global - grab_offset_);
}

void DockingBridge::write_preview(const ResolvedTarget& target, FrameOutput& out) const
{
    if (!target.viewport)
        return;
    for (auto& vo : out.viewports)
    {
        if (vo.viewport != *target.viewport)
            continue;
        const auto& d            = target.decision;
        vo.authority             = d.authority;
        vo.suppress_tree_preview = d.suppress_tree_preview;
        vo.target_floating       = target.floating;
        vo.overlay               = d.paint;
        vo.hovered               = d.hovered;
        if (d.authority == Authority::Bridge)
        {
            vo.preview_rect = d.preview_rect;
            if (!d.into_empty_tree)
                vo.insertion = d.insertion_final;
        }
        else if (d.authority == Authority::Tree && d.tree_zone)
        {
            vo.tree_preview_rect = d.tree_zone->preview;
            vo.insertion         = d.tree_zone->insertion;
        }
    }
}

// ─── Ghost tear-off ──────────────────────────────────────────────────────────

void DockingBridge::maybe_spawn_ghost(const DragPayload& payload, const PointerState& pointer)
{
    if (!pointer.global)
        return;
    auto src = source_surface_global(payload);
    if (!src || src->distance_to(*pointer.global) <= options_.tear_off_threshold)
        return;
    auto host = host_from_payload(payload);
    if (!host)
        return;

    clear_tree_drag_state();
    grab_offset_ = options_.detached_grab_offset;

    if (options_.ghost_spawn_native_on_leave_dock)
    {
        auto vp = lifecycle_.tear_off_to_viewport(*host, *pointer.global, monitors_);
        if (!vp)
            return;
        session_.retarget(DragPayload{id_, *vp, std::nullopt, std::nullopt});
        ghost_ = GhostDrag{DetachedHost{*vp}};
        if (model_.detached(*vp)->placement.decoration == DecorationMode::OsDecorated)
            lifecycle_.begin_native_move(*vp);
        lifecycle_.push_event({LifecycleEvent::Kind::GhostSpawned, *vp, std::nullopt, "native"});
        return;
    }

    ViewportId viewport = payload.source_viewport;
    auto       local    = geometry_.to_local(viewport, *pointer.global);
    if (!local)
        return;
    auto fid = lifecycle_.tear_off_to_floating(*host, viewport, *local);
    if (!fid)
        return;
    session_.retarget(DragPayload{id_, viewport, *fid, std::nullopt});
    ghost_ = GhostDrag{FloatingHost{viewport, *fid, std::nullopt}};
    lifecycle_.push_event({LifecycleEvent::Kind::GhostSpawned, viewport, *fid, "contained"});
}

void DockingBridge::maybe_upgrade_ghost(const PointerState& pointer)
{
    if (!options_.ghost_upgrade_to_native_on_leave_viewport || !pointer.global)
        return;
    const auto* contained = std::get_if<FloatingHost>(&ghost_->host);
    if (!contained)
        return;
    auto inner = geometry_.last_known_inner_rect(contained->viewport);
    if (!inner || inner->contains(*pointer.global))
        return;

    const FloatingHost host = *contained;
    auto vp = lifecycle_.promote_floating(host.viewport, host.floating, *pointer.global, monitors_);
    if (!vp)
        return;
    session_.retarget(DragPayload{id_, *vp, std::nullopt, std::nullopt});
    ghost_->host = DetachedHost{*vp};
    if (model_.detached(*vp)->placement.decoration == DecorationMode::OsDecorated)
        lifecycle_.begin_native_move(*vp);
    lifecycle_.push_event({LifecycleEvent::Kind::GhostUpgraded, *vp, std::nullopt, "left viewport"});
}

void DockingBridge::finalize_ghost(FrameOutput& out)
{
    if (!ghost_)
        return;

    ViewportId                viewport = ROOT_VIEWPORT_ID;
    std::optional<FloatingId> floating;
    if (const auto* f = std::get_if<FloatingHost>(&ghost_->host))
    {
        viewport = f->viewport;
        floating = f->floating;
    }
    else if (const auto* d = std::get_if<DetachedHost>(&ghost_->host))
    {
        viewport = d->viewport;
    }
    ghost_.reset();

    // A dock target that claimed the release wins over finalize.
    if (session_.release_claimed())
    {
        DOCKBRIDGE_LOG_DEBUG(log_category::LIFECYCLE,
                             "ghost release claimed by '{}'; finalize skipped",
                             session_.claimed_by());
        return;
    }
    if (!session_.claim_release("ghost_finalize"))
        return;

    lifecycle_.push_event({LifecycleEvent::Kind::GhostFinalized, viewport, floating, "released"});
    if (!out.drop || out.drop->kind == DropOutcomeKind::NoOp)
    {
        out.drop = DropOutcome{.kind     = DropOutcomeKind::GhostFinalized,
                               .resolved = resolver_.phase(),
                               .status   = MoveStatus::Applied,
                               .viewport = viewport,
                               .floating = floating};
    }
}

// ─── Release ─────────────────────────────────────────────────────────────────

void DockingBridge::handle_release(const ViewportInput* delivered, PointerState pointer, FrameOutput& out)
{
    DragSession::EndGuard end_guard(session_);
    const DragPayload     payload = *session_.payload();

    if (!pointer.global)
    {
        const auto& cached = resolver_.last_preview();
        if (cached && cached->drag_serial == session_.serial() && cached->pointer.global)
        {
            pointer.global  = cached->pointer.global;
            pointer.hovered = cached->pointer.hovered;
        }
        else
        {
            pointer.global = last_pointer_global_;
        }
    }

    ResolvedTarget target = resolver_.resolve_target(payload, pointer);
    check_preview(pointer, target);

    const bool forced = force_tear_off(payload, pointer.modifiers);

    // Viewport passes, root first.
    for (ViewportId vp : model_.viewport_ids())
    {
        if (!delivered || delivered->viewport != vp)
            continue;
        if (resolver_.route_release(vp, target, pointer, forced) == DropPhase::LocalResolve)
            out.drop = apply_target(payload, target, DropPhase::LocalResolve);
        else
            resolver_.defer(PendingDrop{payload, pointer.global, pointer.hovered, pointer.modifiers, vp});
    }
    if (!out.drop && !resolver_.has_pending())
    {
        resolver_.defer(PendingDrop{payload,
                                    pointer.global,
                                    pointer.hovered,
                                    pointer.modifiers,
                                    delivered ? std::optional<ViewportId>(delivered->viewport)
                                              : std::nullopt});
    }

    // RootApply: after every viewport pass of this frame.
    if (auto pending = resolver_.take_pending())
        out.drop = root_apply(*pending);

    finalize_ghost(out);
    resolver_.finish();
    clear_tree_drag_state();

    if (out.drop)
    {
        DOCKBRIDGE_LOG_INFO(log_category::DROP,
                            "drag {} released: {} via {} ({})",
                            session_.serial(),
                            drop_outcome_name(out.drop->kind),
                            drop_phase_name(out.drop->resolved),
                            move_status_name(out.drop->status));
        record(DiagnosticKind::Drop,
               std::string(drop_outcome_name(out.drop->kind)) + " via "
                   + drop_phase_name(out.drop->resolved));
    }
}

DropOutcome DockingBridge::root_apply(const PendingDrop& pending)
{
    const PointerState pointer = pending.pointer();
    ResolvedTarget     target  = resolver_.resolve_target(pending.payload, pointer);
    if (!force_tear_off(pending.payload, pointer.modifiers) && target.has_target())
        return apply_target(pending.payload, target, DropPhase::RootApply);
    return tear_off(pending.payload, pointer);
}

DropOutcome DockingBridge::apply_target(const DragPayload&    payload,
                                        const ResolvedTarget& target,
                                        DropPhase             phase)
{
    DropOutcome o;
    o.resolved = phase;
    o.viewport = target.viewport;
    o.floating = target.floating;

    auto host = host_from_payload(payload);
    if (!host)
    {
        o.status = MoveStatus::SourceMissing;
        return o;
    }

    const OverlayDecision& d = target.decision;
    if (d.authority == Authority::Tree)
    {
        if (!session_.claim_exclusive("tree_internal_drop"))
        {
            record(DiagnosticKind::DoubleClaim, "tree reorder refused: release already claimed");
                return o;
        }
        DockTree* tree = model_.tree(target.tree());
        if (tree && payload.tile_id && tree->move_within(*payload.tile_id, d.tree_zone->insertion))
        {
            o.kind   = DropOutcomeKind::Reordered;
            o.status = MoveStatus::Applied;
        }
        else
        {
            o.status = MoveStatus::StructuralViolation;
            DOCKBRIDGE_LOG_WARN(log_category::DROP, "tree reorder rejected; layout unchanged");
            record(DiagnosticKind::StructuralViolation, "tree reorder rejected");
        }
        return o;
    }

    DropDestination dest{target.tree(), d.into_empty_tree ? std::nullopt : d.insertion_final};
    if (!session_.claim_exclusive(phase == DropPhase::LocalResolve ? "local_drop" : "root_apply"))
    {
        record(DiagnosticKind::DoubleClaim, "drop refused: release already claimed");
        return o;
    }

    MoveResult r = model_.move_to(*host, dest);
    o.status     = r.status;
    switch (r.status)
    {
        case MoveStatus::Applied:
            o.kind = DropOutcomeKind::Docked;
            if (target.floating)
                model_.floating(*target.viewport).bring_to_front(*target.floating);
            break;
        case MoveStatus::StructuralViolation:
            DOCKBRIDGE_LOG_WARN(log_category::DROP,
                                "drop into viewport {} rejected: would break the tree",
                                target.tree().viewport);
            record(DiagnosticKind::StructuralViolation,
                   "drop into viewport " + std::to_string(target.tree().viewport) + " rejected");
            break;
        case MoveStatus::MissingTarget:
        case MoveStatus::SourceMissing:
            DOCKBRIDGE_LOG_DEBUG(log_category::DROP, "drop is a no-op: {}", move_status_name(r.status));
            break;
    }
    return o;
}

DropOutcome DockingBridge::tear_off(const DragPayload& payload, const PointerState& pointer)
{
    DropOutcome o;
    o.resolved = DropPhase::RootApply;

    auto host = host_from_payload(payload);
    if (payload.is_window_move() || !pointer.global || !host)
        return o;

    if (!force_tear_off(payload, pointer.modifiers))
    {
        auto src = source_surface_global(payload);
        if (!src || src->distance_to(*pointer.global) <= options_.tear_off_threshold)
        {
            DOCKBRIDGE_LOG_DEBUG(log_category::DROP, "release without a target inside the source dock; no-op");
            return o;
        }
    }

    WindowHost torn = *host;
    if (options_.detach_parent_tabs_on_shift && pointer.modifiers.shift)
    {
        auto            ref  = model_.tree_of(torn);
        const DockTree* tree = ref ? model_.tree(*ref) : nullptr;
        auto            tile = model_.host_tile(torn);
        auto            parent = tree && tile ? tree->parent_of(*tile) : std::nullopt;
        if (parent && tree->get(*parent)->kind == TileKind::Tabs)
        {
            if (auto* docked = std::get_if<DockedHost>(&torn))
                docked->tile = *parent;
            else if (auto* contained = std::get_if<FloatingHost>(&torn))
                contained->tile = *parent;
        }
    }

    if (!session_.claim_exclusive("tear_off"))
    {
        record(DiagnosticKind::DoubleClaim, "tear-off refused: release already claimed");
        return o;
    }

    if (options_.tear_off_to_floating_on_ctrl && pointer.modifiers.ctrl)
    {
        ViewportId viewport =
            geometry_.viewport_at_global(*pointer.global).value_or(payload.source_viewport);
        auto local = geometry_.to_local(viewport, *pointer.global);
        if (!local)
        {
            viewport = payload.source_viewport;
            local    = geometry_.to_local(viewport, *pointer.global);
        }
        auto fid = local ? lifecycle_.tear_off_to_floating(torn, viewport, *local) : std::nullopt;
        if (fid)
        {
            o.kind     = DropOutcomeKind::TornOffFloating;
            o.status   = MoveStatus::Applied;
            o.viewport = viewport;
            o.floating = fid;
        }
        return o;
    }

    if (auto vp = lifecycle_.tear_off_to_viewport(torn, *pointer.global, monitors_))
    {
        o.kind     = DropOutcomeKind::TornOffViewport;
        o.status   = MoveStatus::Applied;
        o.viewport = vp;
    }
    return o;
}

void DockingBridge::check_preview(const PointerState& pointer, const ResolvedTarget& target)
{
    const auto& cached = resolver_.last_preview();
    if (!cached || cached->drag_serial != session_.serial() || !(cached->pointer == pointer))
        return;
    if (!same_outcome(cached->target, target))
    {
        DOCKBRIDGE_LOG_WARN(log_category::DROP, "release resolves differently from the preview for the same input");
        record(DiagnosticKind::Drop, "preview and release disagree");
    }
}

// ─── Layout persistence ──────────────────────────────────────────────────────

LayoutSnapshot DockingBridge::capture_layout(const PaneRegistry& registry) const
{
    return dockbridge::capture_layout(model_, registry);
}

std::optional<RestoreReport> DockingBridge::restore_layout(const LayoutSnapshot& snapshot,
                                                           const PaneRegistry&   registry)
{
    if (session_.is_active())
    {
        DOCKBRIDGE_LOG_WARN(log_category::PERSIST, "layout restore refused during a drag");
        return std::nullopt;
    }

    for (ViewportId id : model_.viewport_ids())
    {
        if (id == ROOT_VIEWPORT_ID)
            continue;
        if (WindowBackend* backend = lifecycle_.backend())
            backend->destroy_window(id);
        geometry_.forget(id);
        dock_rects_.erase(id);
    }

    RestoreReport report = dockbridge::restore_layout(model_, snapshot, registry, monitors_);
    lifecycle_.create_windows_for_model();
    return report;
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

std::optional<Rect> DockingBridge::source_surface_global(const DragPayload& payload) const
{
    auto inner = geometry_.last_known_inner_rect(payload.source_viewport);
    if (!inner)
        return std::nullopt;

    Rect local;
    if (payload.source_floating)
    {
        const FloatingRect* fr = geometry_.floating(payload.source_viewport, *payload.source_floating);
        if (!fr)
            return std::nullopt;
        local = fr->content;
    }
    else
    {
        auto it = dock_rects_.find(payload.source_viewport);
        if (it == dock_rects_.end())
            return std::nullopt;
        local = it->second;
    }
    return local.translate(inner->min());
}

bool DockingBridge::force_tear_off(const DragPayload& payload, const Modifiers& modifiers) const
{
    return !payload.is_window_move() && options_.detach_on_alt_release_anywhere && modifiers.alt;
}

void DockingBridge::clear_tree_drag_state()
{
    for (ViewportId id : model_.viewport_ids())
    {
        if (DockTree* tree = model_.tree({id, std::nullopt}))
            tree->set_dragged_tile(std::nullopt);
    }
    for (const auto& [viewport, fm] : model_.floating_managers())
    {
        for (FloatingId fid : fm.z_order())
        {
            if (FloatingWindow* w = model_.floating_window(viewport, fid))
                w->tree.set_dragged_tile(std::nullopt);
        }
    }
}

void DockingBridge::reconcile(FrameOutput& out)
{
    lifecycle_.reap();
    lifecycle_.refresh_titles();

    auto events = lifecycle_.take_events();
    for (const auto& e : events)
    {
        if (e.kind == LifecycleEvent::Kind::DetachedDestroyed)
        {
            geometry_.forget(e.viewport);
            dock_rects_.erase(e.viewport);
        }
        record(DiagnosticKind::Lifecycle,
               std::string(lifecycle_event_name(e.kind)) + " viewport "
                   + std::to_string(e.viewport) + " (" + e.detail + ")");
    }
    out.events.insert(out.events.end(), events.begin(), events.end());

    if (!options_.debug_integrity)
        return;

    auto check = [this](const DockTree& tree, const std::string& name)
    {
        for (const auto& issue : tree.integrity_issues())
        {
            DOCKBRIDGE_LOG_WARN(log_category::TREE, "{}: {}", name, issue);
            record(DiagnosticKind::IntegrityIssue, name + ": " + issue);
        }
    };
    check(model_.root_tree(), "root");
    for (const auto& [id, dock] : model_.detached_docks())
        check(dock.tree, "viewport " + std::to_string(id));
    for (const auto& [viewport, fm] : model_.floating_managers())
    {
        for (FloatingId fid : fm.z_order())
            check(fm.get(fid)->tree, "floating " + std::to_string(fid));
    }
}

}   // namespace dockbridge
