#include "lifecycle_manager.hpp"

#include <algorithm>
#include <dockbridge/logger.hpp>

#include "monitor_clamp.hpp"

namespace dockbridge
{

const char* lifecycle_event_name(LifecycleEvent::Kind kind)
{
    switch (kind)
    {
        case LifecycleEvent::Kind::DetachedCreated:
            return "detached-created";
        case LifecycleEvent::Kind::DetachedDestroyed:
            return "detached-destroyed";
        case LifecycleEvent::Kind::FloatingCreated:
            return "floating-created";
        case LifecycleEvent::Kind::FloatingDestroyed:
            return "floating-destroyed";
        case LifecycleEvent::Kind::GhostSpawned:
            return "ghost-spawned";
        case LifecycleEvent::Kind::GhostUpgraded:
            return "ghost-upgraded";
        case LifecycleEvent::Kind::GhostFinalized:
            return "ghost-finalized";
    }
    return "unknown";
}

LifecycleManager::LifecycleManager(const DockingOptions& options, DockModel& model)
    : options_(&options), model_(&model)
{
}

// ─── Tear-off ────────────────────────────────────────────────────────────────

std::optional<Vec2> LifecycleManager::content_size_of(const WindowHost& source) const
{
    auto ref  = model_->tree_of(source);
    auto tile = model_->host_tile(source);
    if (!ref || !tile)
        return std::nullopt;
    const DockTree* tree = model_->tree(*ref);
    auto            rect = tree ? tree->tile_rect(*tile) : std::nullopt;
    if (!rect || !rect->is_positive())
        return std::nullopt;
    return Vec2{rect->w, rect->h};
}

ViewportPlacement LifecycleManager::placement_for_tear_off(
    std::optional<Vec2>                     content_size,
    const Vec2&                             pointer_global,
    const std::optional<std::vector<Rect>>& monitors) const
{
    Vec2 size = options_->default_detached_size;
    if (content_size)
    {
        size = {std::max(content_size->x, options_->min_detached_size.x),
                std::max(content_size->y, options_->min_detached_size.y)};
    }

    ViewportPlacement placement;
    placement.size       = size;
    placement.position   = pointer_global - options_->detached_grab_offset;
    placement.decoration = options_->decoration;
    if (monitors && !monitors->empty())
        placement.position = clamp_to_monitors(placement.position, size, *monitors);
    return placement;
}

std::optional<ViewportId> LifecycleManager::tear_off_to_viewport(
    const WindowHost&                       source,
    const Vec2&                             pointer_global,
    const std::optional<std::vector<Rect>>& monitors)
{
    auto      src_ref = model_->tree_of(source);
    DockTree* src     = src_ref ? model_->tree(*src_ref) : nullptr;
    if (!src)
        return std::nullopt;

    auto     size   = content_size_of(source);
    DockTree backup = *src;
    auto     sub    = model_->take_from_host(source);
    if (!sub || sub->empty())
    {
        DOCKBRIDGE_LOG_DEBUG(log_category::LIFECYCLE, "tear-off: source content missing");
        return std::nullopt;
    }

    DockTree tree      = DockTree::from_subtree(std::move(*sub), model_->allocator());
    auto     placement = placement_for_tear_off(size, pointer_global, monitors);
    placement.title    = title_for(tree);

    ViewportId id = model_->add_detached(std::move(tree), placement);
    if (backend_ && !backend_->create_window(id, placement))
    {
        DOCKBRIDGE_LOG_ERROR(log_category::LIFECYCLE,
                             "backend refused window for viewport {}; tear-off rolled back",
                             id);
        model_->remove_detached(id);
        // Re-resolve: the model's maps may have been touched.
        if (DockTree* restored = model_->tree(*src_ref))
            *restored = std::move(backup);
        return std::nullopt;
    }

    DOCKBRIDGE_LOG_INFO(log_category::LIFECYCLE,
                        "detached viewport {} created at ({}, {}) size {}x{}",
                        id,
                        placement.position.x,
                        placement.position.y,
                        placement.size.x,
                        placement.size.y);
    events_.push_back({LifecycleEvent::Kind::DetachedCreated, id, std::nullopt, "tear-off"});
    return id;
}

std::optional<FloatingId> LifecycleManager::tear_off_to_floating(const WindowHost& source,
                                                                 ViewportId        viewport,
                                                                 const Vec2&       pointer_local)
{
    if (!model_->has_viewport(viewport))
        return std::nullopt;

    auto content = content_size_of(source);
    auto sub     = model_->take_from_host(source);
    if (!sub || sub->empty())
        return std::nullopt;

    Vec2 size = options_->default_detached_size;
    if (content)
    {
        size = {std::max(content->x, options_->min_detached_size.x),
                std::max(content->y + options_->floating_title_height,
                         options_->min_detached_size.y)};
    }

    DockTree   tree = DockTree::from_subtree(std::move(*sub), model_->allocator());
    FloatingId id =
        model_->add_floating(viewport, std::move(tree), pointer_local - options_->detached_grab_offset, size);

    DOCKBRIDGE_LOG_INFO(log_category::LIFECYCLE, "floating window {} created in viewport {}", id, viewport);
    events_.push_back({LifecycleEvent::Kind::FloatingCreated, viewport, id, "tear-off"});
    return id;
}

std::optional<ViewportId> LifecycleManager::promote_floating(
    ViewportId                              viewport,
    FloatingId                              floating,
    const Vec2&                             pointer_global,
    const std::optional<std::vector<Rect>>& monitors)
{
    FloatingWindow* w = model_->floating_window(viewport, floating);
    if (!w || w->tree.is_empty())
        return std::nullopt;

    Vec2     size = w->size;
    DockTree tree = std::move(w->tree);
    w->tree       = model_->make_tree();
    model_->remove_floating(viewport, floating);

    auto placement  = placement_for_tear_off(size, pointer_global, monitors);
    placement.title = title_for(tree);

    DockTree   backup = tree;
    ViewportId id     = model_->add_detached(std::move(tree), placement);
    if (backend_ && !backend_->create_window(id, placement))
    {
        DOCKBRIDGE_LOG_ERROR(log_category::LIFECYCLE,
                             "backend refused window for promoted floating {}; kept contained",
                             floating);
        model_->remove_detached(id);
        model_->restore_floating(viewport,
                                 floating,
                                 std::move(backup),
                                 pointer_global - options_->detached_grab_offset,
                                 size,
                                 false);
        return std::nullopt;
    }

    events_.push_back({LifecycleEvent::Kind::FloatingDestroyed, viewport, floating, "promoted"});
    events_.push_back({LifecycleEvent::Kind::DetachedCreated, id, std::nullopt, "promoted"});
    DOCKBRIDGE_LOG_INFO(log_category::LIFECYCLE, "floating {} promoted to viewport {}", floating, id);
    return id;
}

void LifecycleManager::create_windows_for_model()
{
    if (!backend_)
        return;
    std::vector<ViewportId> refused;
    for (const auto& [id, dock] : model_->detached_docks())
    {
        if (!backend_->create_window(id, dock.placement))
            refused.push_back(id);
        else
            events_.push_back({LifecycleEvent::Kind::DetachedCreated, id, std::nullopt, "restore"});
    }
    for (ViewportId id : refused)
    {
        DOCKBRIDGE_LOG_ERROR(log_category::LIFECYCLE, "backend refused restored viewport {}", id);
        model_->remove_detached(id);
    }
}

// ─── Window commands ─────────────────────────────────────────────────────────

void LifecycleManager::move_viewport(ViewportId viewport, const Vec2& position)
{
    DetachedDock* dock = model_->detached(viewport);
    if (!dock || dock->placement.position == position)
        return;
    dock->placement.position = position;
    if (backend_)
        backend_->set_window_placement(viewport, dock->placement);
}

void LifecycleManager::begin_native_move(ViewportId viewport)
{
    if (!model_->detached(viewport))
        return;
    if (backend_)
        backend_->begin_native_drag_move(viewport);
    DOCKBRIDGE_LOG_DEBUG(log_category::LIFECYCLE, "native move started for viewport {}", viewport);
}

void LifecycleManager::destroy_viewport(ViewportId viewport, const std::string& reason)
{
    if (!model_->remove_detached(viewport))
        return;
    if (backend_)
        backend_->destroy_window(viewport);
    DOCKBRIDGE_LOG_INFO(log_category::LIFECYCLE, "detached viewport {} destroyed ({})", viewport, reason);
    events_.push_back({LifecycleEvent::Kind::DetachedDestroyed, viewport, std::nullopt, reason});
}

// ─── Reconcile ───────────────────────────────────────────────────────────────

void LifecycleManager::reap()
{
    // Floating windows first: a viewport left with only empty floating
    // windows and an empty tree goes in the same pass.
    std::vector<std::pair<ViewportId, FloatingId>> empty_floating;
    for (const auto& [viewport, fm] : model_->floating_managers())
    {
        for (FloatingId id : fm.empty_windows())
            empty_floating.emplace_back(viewport, id);
    }
    for (const auto& [viewport, id] : empty_floating)
    {
        model_->remove_floating(viewport, id);
        DOCKBRIDGE_LOG_INFO(log_category::LIFECYCLE, "floating window {} reaped (empty)", id);
        events_.push_back({LifecycleEvent::Kind::FloatingDestroyed, viewport, id, "empty"});
    }

    std::vector<ViewportId> empty_docks;
    for (const auto& [id, dock] : model_->detached_docks())
    {
        const FloatingManager* fm = model_->floating_if(id);
        if (dock.tree.is_empty() && (!fm || fm->empty()))
            empty_docks.push_back(id);
    }
    for (ViewportId id : empty_docks)
        destroy_viewport(id, "empty");
}

std::string LifecycleManager::title_for(const DockTree& tree) const
{
    auto pane = tree.first_pane();
    if (!pane)
        return "Dock";
    if (title_provider_)
        return title_provider_(*pane);
    return "Pane " + std::to_string(*pane);
}

void LifecycleManager::refresh_titles()
{
    for (ViewportId id : model_->viewport_ids())
    {
        DetachedDock* dock = model_->detached(id);
        if (!dock || dock->tree.is_empty())
            continue;
        std::string title = title_for(dock->tree);
        if (title == dock->placement.title)
            continue;
        dock->placement.title = std::move(title);
        if (backend_)
            backend_->set_window_placement(id, dock->placement);
    }
}

std::vector<LifecycleEvent> LifecycleManager::take_events()
{
    std::vector<LifecycleEvent> out;
    out.swap(events_);
    return out;
}

void LifecycleManager::push_event(LifecycleEvent event)
{
    events_.push_back(std::move(event));
}

}   // namespace dockbridge
