#include "dock_model.hpp"

#include <algorithm>
#include <dockbridge/logger.hpp>
#include <sstream>

#include "persist/layout_snapshot.hpp"

namespace dockbridge
{

const char* move_status_name(MoveStatus status)
{
    switch (status)
    {
        case MoveStatus::Applied:
            return "applied";
        case MoveStatus::MissingTarget:
            return "missing-target";
        case MoveStatus::StructuralViolation:
            return "structural-violation";
        case MoveStatus::SourceMissing:
            return "source-missing";
    }
    return "unknown";
}

std::optional<WindowHost> host_from_payload(const DragPayload& payload)
{
    if (payload.source_floating)
        return FloatingHost{payload.source_viewport, *payload.source_floating, payload.tile_id};
    if (payload.tile_id)
        return DockedHost{payload.source_viewport, *payload.tile_id};
    if (payload.source_viewport != ROOT_VIEWPORT_ID)
        return DetachedHost{payload.source_viewport};
    // The root viewport cannot be dragged as a whole.
    return std::nullopt;
}

// ─── DockModel ───────────────────────────────────────────────────────────────

DockModel::DockModel(const DockingOptions& options)
    : options_(&options), allocator_(std::make_shared<TileIdAllocator>()), root_(allocator_)
{
    root_.set_allow_container_tabbing(options.allow_container_tabbing);
}

DockTree DockModel::make_tree() const
{
    DockTree tree(allocator_);
    tree.set_allow_container_tabbing(options_->allow_container_tabbing);
    return tree;
}

void DockModel::replace_root(DockTree tree)
{
    root_ = std::move(tree);
    root_.set_allow_container_tabbing(options_->allow_container_tabbing);
}

DockTree* DockModel::tree(const TreeRef& ref)
{
    return const_cast<DockTree*>(static_cast<const DockModel*>(this)->tree(ref));
}

const DockTree* DockModel::tree(const TreeRef& ref) const
{
    if (ref.floating)
    {
        const auto* fm = floating_if(ref.viewport);
        const auto* w  = fm ? fm->get(*ref.floating) : nullptr;
        return w ? &w->tree : nullptr;
    }
    if (ref.viewport == ROOT_VIEWPORT_ID)
        return &root_;
    const auto* d = detached(ref.viewport);
    return d ? &d->tree : nullptr;
}

bool DockModel::has_viewport(ViewportId id) const
{
    return id == ROOT_VIEWPORT_ID || detached_.count(id) > 0;
}

std::vector<ViewportId> DockModel::viewport_ids() const
{
    std::vector<ViewportId> ids{ROOT_VIEWPORT_ID};
    for (const auto& [id, dock] : detached_)
        ids.push_back(id);
    return ids;
}

DetachedDock* DockModel::detached(ViewportId id)
{
    auto it = detached_.find(id);
    return it != detached_.end() ? &it->second : nullptr;
}

const DetachedDock* DockModel::detached(ViewportId id) const
{
    auto it = detached_.find(id);
    return it != detached_.end() ? &it->second : nullptr;
}

ViewportId DockModel::add_detached(DockTree tree, ViewportPlacement placement)
{
    ViewportId id = next_viewport_id_++;
    tree.set_allow_container_tabbing(options_->allow_container_tabbing);
    detached_.emplace(id,
                      DetachedDock{.viewport  = id,
                                   .serial    = next_serial_++,
                                   .tree      = std::move(tree),
                                   .placement = std::move(placement)});
    return id;
}

bool DockModel::remove_detached(ViewportId id)
{
    if (detached_.erase(id) == 0)
        return false;
    floating_.erase(id);
    return true;
}

bool DockModel::restore_detached(ViewportId        id,
                                 uint64_t          serial,
                                 DockTree          tree,
                                 ViewportPlacement placement)
{
    if (id == ROOT_VIEWPORT_ID || detached_.count(id))
        return false;
    tree.set_allow_container_tabbing(options_->allow_container_tabbing);
    detached_.emplace(id,
                      DetachedDock{.viewport  = id,
                                   .serial    = serial,
                                   .tree      = std::move(tree),
                                   .placement = std::move(placement)});
    next_viewport_id_ = std::max(next_viewport_id_, id + 1);
    next_serial_      = std::max(next_serial_, serial + 1);
    return true;
}

const FloatingManager* DockModel::floating_if(ViewportId viewport) const
{
    auto it = floating_.find(viewport);
    return it != floating_.end() ? &it->second : nullptr;
}

FloatingWindow* DockModel::floating_window(ViewportId viewport, FloatingId id)
{
    auto it = floating_.find(viewport);
    return it != floating_.end() ? it->second.get(id) : nullptr;
}

FloatingId DockModel::add_floating(ViewportId  viewport,
                                   DockTree    tree,
                                   const Vec2& offset,
                                   const Vec2& size)
{
    FloatingId id = next_floating_id_++;
    tree.set_allow_container_tabbing(options_->allow_container_tabbing);
    floating_[viewport].add(id, std::move(tree), offset, size);
    return id;
}

bool DockModel::remove_floating(ViewportId viewport, FloatingId id)
{
    auto it = floating_.find(viewport);
    if (it == floating_.end() || !it->second.remove(id))
        return false;
    if (it->second.empty())
        floating_.erase(it);
    return true;
}

bool DockModel::restore_floating(ViewportId  viewport,
                                 FloatingId  id,
                                 DockTree    tree,
                                 const Vec2& offset,
                                 const Vec2& size,
                                 bool        collapsed)
{
    if (!has_viewport(viewport) || floating_window(viewport, id))
        return false;
    tree.set_allow_container_tabbing(options_->allow_container_tabbing);
    floating_[viewport].add(id, std::move(tree), offset, size).collapsed = collapsed;
    next_floating_id_ = std::max(next_floating_id_, id + 1);
    return true;
}

void DockModel::set_counters(ViewportId next_viewport, uint64_t next_serial, FloatingId next_floating)
{
    next_viewport_id_ = std::max(next_viewport_id_, next_viewport);
    next_serial_      = std::max(next_serial_, next_serial);
    next_floating_id_ = std::max(next_floating_id_, next_floating);
}

void DockModel::clear()
{
    root_.clear();
    detached_.clear();
    floating_.clear();
}

// ─── Moves ───────────────────────────────────────────────────────────────────

std::optional<TreeRef> DockModel::tree_of(const WindowHost& host) const
{
    if (const auto* d = std::get_if<DockedHost>(&host))
        return TreeRef{d->viewport, std::nullopt};
    if (const auto* f = std::get_if<FloatingHost>(&host))
        return TreeRef{f->viewport, f->floating};
    return TreeRef{std::get<DetachedHost>(host).viewport, std::nullopt};
}

std::optional<TileId> DockModel::host_tile(const WindowHost& host) const
{
    auto ref = tree_of(host);
    const DockTree* t = ref ? tree(*ref) : nullptr;
    if (!t)
        return std::nullopt;

    if (const auto* d = std::get_if<DockedHost>(&host))
        return t->contains(d->tile) ? std::optional<TileId>(d->tile) : std::nullopt;
    if (const auto* f = std::get_if<FloatingHost>(&host); f && f->tile)
        return t->contains(*f->tile) ? f->tile : std::nullopt;
    return t->root();
}

std::unordered_set<TileId> DockModel::host_ids(const WindowHost& host) const
{
    auto ref  = tree_of(host);
    auto tile = host_tile(host);
    if (!ref || !tile)
        return {};
    return tree(*ref)->subtree_ids(*tile);
}

std::optional<SubTree> DockModel::take_from_host(const WindowHost& host)
{
    auto ref  = tree_of(host);
    auto tile = host_tile(host);
    if (!ref || !tile)
        return std::nullopt;
    return tree(*ref)->extract_subtree(*tile, true);
}

MoveResult DockModel::move_to(const WindowHost& source, const DropDestination& dest)
{
    auto src_ref = tree_of(source);
    DockTree* src = src_ref ? tree(*src_ref) : nullptr;
    auto      tile = host_tile(source);
    if (!src || !tile)
        return {MoveStatus::SourceMissing};

    DockTree* dst = tree(dest.tree);
    if (!dst)
        return {MoveStatus::MissingTarget};

    // Collected before anything is extracted.
    auto dragged = src->subtree_ids(*tile);

    if (dest.insertion)
    {
        TileId parent = dest.insertion->parent;
        if (*src_ref == dest.tree && dragged.count(parent))
            return {MoveStatus::StructuralViolation};
        if (!dst->contains(parent))
            return {MoveStatus::MissingTarget};
        if (dst->would_self_parent(parent, dragged))
            return {MoveStatus::StructuralViolation};
    }
    else if (!dst->is_empty())
    {
        return {MoveStatus::MissingTarget};
    }

    if (*src_ref == dest.tree)
    {
        // A whole window cannot be docked into itself.
        if (src->root() == tile || !dest.insertion)
            return {MoveStatus::StructuralViolation};
        if (!src->move_within(*tile, *dest.insertion))
            return {MoveStatus::StructuralViolation};
        return {MoveStatus::Applied, *tile};
    }

    DockTree backup = *src;
    auto     sub    = src->extract_subtree(*tile, true);
    if (!sub)
        return {MoveStatus::SourceMissing};

    auto new_root = dst->insert_subtree(*sub, dest.insertion);
    if (!new_root)
    {
        *src = std::move(backup);
        return {MoveStatus::StructuralViolation};
    }
    return {MoveStatus::Applied, *new_root};
}

// ─── Diagnostics ─────────────────────────────────────────────────────────────

std::string DockModel::serialize() const
{
    std::ostringstream ss;
    ss << "{\"root\":" << root_.serialize() << ",\"detached\":[";
    bool first = true;
    for (const auto& [id, d] : detached_)
    {
        if (!first)
            ss << ",";
        first = false;
        const auto& p = d.placement;
        ss << "{\"viewport\":" << id << ",\"serial\":" << d.serial << ",\"pos\":[" << p.position.x
           << "," << p.position.y << "],\"size\":[" << p.size.x << "," << p.size.y
           << "],\"title\":\"" << escape_json(p.title) << "\",\"decoration\":"
           << static_cast<int>(p.decoration) << ",\"maximized\":" << p.maximized
           << ",\"fullscreen\":" << p.fullscreen << ",\"tree\":" << d.tree.serialize() << "}";
    }
    ss << "],\"floating\":[";
    first = true;
    for (const auto& [viewport, fm] : floating_)
    {
        for (FloatingId fid : fm.z_order())
        {
            const auto* w = fm.get(fid);
            if (!first)
                ss << ",";
            first = false;
            ss << "{\"viewport\":" << viewport << ",\"id\":" << fid << ",\"offset\":["
               << w->offset.x << "," << w->offset.y << "],\"size\":[" << w->size.x << ","
               << w->size.y << "],\"collapsed\":" << w->collapsed
               << ",\"tree\":" << w->tree.serialize() << "}";
        }
    }
    ss << "]}";
    return ss.str();
}

}   // namespace dockbridge
