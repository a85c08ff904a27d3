#include "dock_tree.hpp"

#include <algorithm>
#include <dockbridge/logger.hpp>
#include <sstream>

namespace dockbridge
{

const char* tile_kind_name(TileKind kind)
{
    switch (kind)
    {
        case TileKind::Pane:
            return "pane";
        case TileKind::Tabs:
            return "tabs";
        case TileKind::Horizontal:
            return "horizontal";
        case TileKind::Vertical:
            return "vertical";
    }
    return "unknown";
}

const char* dock_side_name(DockSide side)
{
    switch (side)
    {
        case DockSide::Center:
            return "center";
        case DockSide::Left:
            return "left";
        case DockSide::Right:
            return "right";
        case DockSide::Top:
            return "top";
        case DockSide::Bottom:
            return "bottom";
    }
    return "unknown";
}

InsertionPoint insertion_for_side(TileId tile, DockSide side)
{
    switch (side)
    {
        case DockSide::Center:
            return {tile, TileKind::Tabs, INSERT_AT_END};
        case DockSide::Left:
            return {tile, TileKind::Horizontal, 0};
        case DockSide::Right:
            return {tile, TileKind::Horizontal, INSERT_AT_END};
        case DockSide::Top:
            return {tile, TileKind::Vertical, 0};
        case DockSide::Bottom:
            return {tile, TileKind::Vertical, INSERT_AT_END};
    }
    return {tile, TileKind::Tabs, INSERT_AT_END};
}

Rect side_preview_rect(const Rect& b, DockSide side)
{
    switch (side)
    {
        case DockSide::Left:
            return Rect{b.x, b.y, b.w * 0.5f, b.h};
        case DockSide::Right:
            return Rect{b.x + b.w * 0.5f, b.y, b.w * 0.5f, b.h};
        case DockSide::Top:
            return Rect{b.x, b.y, b.w, b.h * 0.5f};
        case DockSide::Bottom:
            return Rect{b.x, b.y + b.h * 0.5f, b.w, b.h * 0.5f};
        case DockSide::Center:
            return b;
    }
    return b;
}

std::unordered_set<TileId> SubTree::ids() const
{
    std::unordered_set<TileId> out;
    for (const auto& [id, tile] : tiles)
        out.insert(id);
    return out;
}

// ─── DockTree ────────────────────────────────────────────────────────────────

DockTree::DockTree(std::shared_ptr<TileIdAllocator> allocator)
    : allocator_(allocator ? std::move(allocator) : std::make_shared<TileIdAllocator>())
{
}

TileId DockTree::add_pane(PaneId pane)
{
    TileId id = allocator_->allocate();
    tiles_[id] = Tile{.kind = TileKind::Pane, .pane = pane};
    return id;
}

TileId DockTree::add_container(TileKind kind, std::vector<TileId> children)
{
    TileId id = allocator_->allocate();
    Tile   tile{.kind = kind, .children = std::move(children)};
    if (kind == TileKind::Tabs && !tile.children.empty())
        tile.active = tile.children.front();
    tiles_[id] = std::move(tile);
    return id;
}

void DockTree::set_root(TileId id)
{
    if (tiles_.count(id))
        root_ = id;
}

void DockTree::clear()
{
    tiles_.clear();
    root_.reset();
    dragged_tile_.reset();
    rects_.clear();
    tab_bars_.clear();
    tab_buttons_.clear();
}

DockTree DockTree::from_subtree(SubTree subtree, std::shared_ptr<TileIdAllocator> allocator)
{
    DockTree tree(std::move(allocator));
    for (const auto& [id, tile] : subtree.tiles)
        tree.allocator_->observe(id);
    tree.tiles_ = std::move(subtree.tiles);
    if (tree.tiles_.count(subtree.root))
        tree.root_ = subtree.root;
    return tree;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const Tile* DockTree::get(TileId id) const
{
    auto it = tiles_.find(id);
    return it != tiles_.end() ? &it->second : nullptr;
}

std::optional<TileId> DockTree::parent_of(TileId id) const
{
    for (const auto& [pid, tile] : tiles_)
    {
        if (std::find(tile.children.begin(), tile.children.end(), id) != tile.children.end())
            return pid;
    }
    return std::nullopt;
}

void DockTree::collect_ids(TileId id, std::vector<TileId>& out) const
{
    std::unordered_set<TileId> visited;
    std::vector<TileId>        stack{id};
    while (!stack.empty())
    {
        TileId cur = stack.back();
        stack.pop_back();
        auto it = tiles_.find(cur);
        if (it == tiles_.end() || !visited.insert(cur).second)
            continue;
        out.push_back(cur);
        const auto& children = it->second.children;
        for (auto c = children.rbegin(); c != children.rend(); ++c)
            stack.push_back(*c);
    }
}

std::vector<TileId> DockTree::pane_tiles() const
{
    std::vector<TileId> panes;
    if (!root_)
        return panes;
    std::vector<TileId> ids;
    collect_ids(*root_, ids);
    for (TileId id : ids)
    {
        if (tiles_.at(id).is_pane())
            panes.push_back(id);
    }
    return panes;
}

std::optional<TileId> DockTree::find_pane(PaneId pane) const
{
    for (TileId id : pane_tiles())
    {
        if (tiles_.at(id).pane == pane)
            return id;
    }
    return std::nullopt;
}

std::optional<PaneId> DockTree::first_pane() const
{
    auto panes = pane_tiles();
    if (panes.empty())
        return std::nullopt;
    return tiles_.at(panes.front()).pane;
}

std::unordered_set<TileId> DockTree::subtree_ids(TileId id) const
{
    std::vector<TileId> ids;
    collect_ids(id, ids);
    return {ids.begin(), ids.end()};
}

bool DockTree::is_descendant_or_self(TileId ancestor, TileId candidate) const
{
    return subtree_ids(ancestor).count(candidate) > 0;
}

bool DockTree::would_self_parent(TileId target_parent,
                                 const std::unordered_set<TileId>& dragged) const
{
    std::optional<TileId> cur = target_parent;
    // Bounded walk: a corrupted tree must not hang the drop path.
    for (size_t steps = 0; cur && steps <= tiles_.size(); ++steps)
    {
        if (dragged.count(*cur))
            return true;
        cur = parent_of(*cur);
    }
    return false;
}

bool DockTree::set_active_tab(TileId tabs, TileId child)
{
    auto it = tiles_.find(tabs);
    if (it == tiles_.end() || it->second.kind != TileKind::Tabs)
        return false;
    auto& children = it->second.children;
    if (std::find(children.begin(), children.end(), child) == children.end())
        return false;
    it->second.active = child;
    return true;
}

// ─── Structural helpers ──────────────────────────────────────────────────────

void DockTree::replace_child(std::optional<TileId> parent, TileId old_child, TileId new_child)
{
    if (!parent)
    {
        if (root_ && *root_ == old_child)
            root_ = new_child;
        return;
    }
    Tile& p = tiles_.at(*parent);
    std::replace(p.children.begin(), p.children.end(), old_child, new_child);
    if (p.kind == TileKind::Tabs && p.active == old_child)
        p.active = new_child;
}

void DockTree::detach_from_parent(TileId id)
{
    if (root_ && *root_ == id)
    {
        root_.reset();
        return;
    }
    auto parent = parent_of(id);
    if (!parent)
        return;

    Tile& p   = tiles_.at(*parent);
    auto  it  = std::find(p.children.begin(), p.children.end(), id);
    size_t idx = static_cast<size_t>(it - p.children.begin());
    p.children.erase(it);

    if (p.kind == TileKind::Tabs && p.active == id)
    {
        p.active = p.children.empty() ? INVALID_TILE_ID
                                      : p.children[std::min(idx, p.children.size() - 1)];
    }
}

void DockTree::normalize_after_removal(TileId container)
{
    auto it = tiles_.find(container);
    if (it == tiles_.end() || !it->second.is_container())
        return;

    if (it->second.children.empty())
    {
        auto parent = parent_of(container);
        detach_from_parent(container);
        tiles_.erase(container);
        if (parent)
            normalize_after_removal(*parent);
        return;
    }

    if (it->second.is_linear() && it->second.children.size() == 1)
    {
        TileId only   = it->second.children.front();
        auto   parent = parent_of(container);
        replace_child(parent, container, only);
        tiles_.erase(container);
        if (parent)
            splice_same_direction(*parent);
    }
}

void DockTree::splice_same_direction(TileId container)
{
    auto it = tiles_.find(container);
    if (it == tiles_.end() || !it->second.is_linear())
        return;

    Tile&               c = it->second;
    std::vector<TileId> flat;
    flat.reserve(c.children.size());
    for (TileId child : c.children)
    {
        auto ct = tiles_.find(child);
        if (ct != tiles_.end() && ct->second.kind == c.kind)
        {
            flat.insert(flat.end(), ct->second.children.begin(), ct->second.children.end());
            tiles_.erase(ct);
        }
        else
        {
            flat.push_back(child);
        }
    }
    c.children = std::move(flat);
}

void DockTree::remap_colliding_ids(SubTree& subtree)
{
    for (const auto& [id, tile] : subtree.tiles)
        allocator_->observe(id);

    std::map<TileId, TileId> remap;
    for (const auto& [id, tile] : subtree.tiles)
    {
        if (tiles_.count(id))
            remap[id] = allocator_->allocate();
    }
    if (remap.empty())
        return;

    auto map_id = [&](TileId id)
    {
        auto r = remap.find(id);
        return r != remap.end() ? r->second : id;
    };

    SubTree out;
    out.root = map_id(subtree.root);
    for (auto& [id, tile] : subtree.tiles)
    {
        Tile t = std::move(tile);
        for (auto& c : t.children)
            c = map_id(c);
        if (t.active != INVALID_TILE_ID)
            t.active = map_id(t.active);
        out.tiles[map_id(id)] = std::move(t);
    }
    DOCKBRIDGE_LOG_DEBUG(log_category::TREE, "Remapped {} colliding tile ids on insert", remap.size());
    subtree = std::move(out);
}

// ─── Subtree transfer ────────────────────────────────────────────────────────

std::optional<SubTree> DockTree::extract_subtree(TileId id, bool reserve_ids)
{
    if (!tiles_.count(id))
    {
        DOCKBRIDGE_LOG_DEBUG(log_category::TREE, "extract_subtree: tile {} not found", id);
        return std::nullopt;
    }

    std::vector<TileId> ids;
    collect_ids(id, ids);
    auto parent = parent_of(id);
    detach_from_parent(id);

    SubTree sub;
    sub.root = id;
    for (TileId t : ids)
    {
        auto node = tiles_.extract(t);
        if (!node.empty())
            sub.tiles.insert(std::move(node));
        rects_.erase(t);
        tab_bars_.erase(t);
        tab_buttons_.erase(t);
    }
    if (parent)
        normalize_after_removal(*parent);
    if (dragged_tile_ && sub.tiles.count(*dragged_tile_))
        dragged_tile_.reset();

    if (reserve_ids)
    {
        TileId                   base = allocator_->reserve_block(ids.size());
        std::map<TileId, TileId> remap;
        for (size_t i = 0; i < ids.size(); ++i)
            remap[ids[i]] = base + i;

        auto map_id = [&](TileId old_id)
        {
            auto r = remap.find(old_id);
            return r != remap.end() ? r->second : old_id;
        };

        SubTree rekeyed;
        rekeyed.root = map_id(sub.root);
        for (auto& [old_id, tile] : sub.tiles)
        {
            Tile t = std::move(tile);
            for (auto& c : t.children)
                c = map_id(c);
            if (t.active != INVALID_TILE_ID)
                t.active = map_id(t.active);
            rekeyed.tiles[map_id(old_id)] = std::move(t);
        }
        sub = std::move(rekeyed);
    }

    DOCKBRIDGE_LOG_DEBUG(log_category::TREE,
                         "Extracted subtree of {} tiles (root {}, reserved={})",
                         sub.tiles.size(),
                         sub.root,
                         reserve_ids);
    return sub;
}

std::optional<TileId> DockTree::insert_subtree(SubTree&                             subtree,
                                               const std::optional<InsertionPoint>& at)
{
    if (subtree.tiles.empty() || !subtree.tiles.count(subtree.root))
    {
        DOCKBRIDGE_LOG_WARN(log_category::TREE, "insert_subtree: empty or rootless subtree");
        return std::nullopt;
    }

    if (at)
    {
        if (subtree.tiles.count(at->parent))
        {
            DOCKBRIDGE_LOG_WARN(log_category::TREE,
                                "insert_subtree: target {} lies inside the inserted subtree",
                                at->parent);
            return std::nullopt;
        }
        if (!root_ || !tiles_.count(at->parent) || !is_descendant_or_self(*root_, at->parent))
        {
            DOCKBRIDGE_LOG_DEBUG(log_category::TREE, "insert_subtree: target {} not in tree", at->parent);
            return std::nullopt;
        }
    }

    remap_colliding_ids(subtree);

    if (!at && !root_)
    {
        TileId new_root = subtree.root;
        for (auto& [id, tile] : subtree.tiles)
            tiles_.emplace(id, std::move(tile));
        subtree = SubTree{};
        root_   = new_root;
        return new_root;
    }

    InsertionPoint point = at ? *at : InsertionPoint{*root_, TileKind::Tabs, INSERT_AT_END};
    return attach(subtree, point);
}

TileId DockTree::attach(SubTree& subtree, const InsertionPoint& at)
{
    std::vector<TileId> new_children;
    const Tile&         sub_root = subtree.tiles.at(subtree.root);

    if (at.kind == TileKind::Tabs && sub_root.is_container() && !allow_container_tabbing_)
    {
        // Tab groups hold panes: the subtree's containers dissolve.
        std::vector<TileId>        stack{subtree.root};
        std::unordered_set<TileId> visited;
        while (!stack.empty())
        {
            TileId cur = stack.back();
            stack.pop_back();
            auto it = subtree.tiles.find(cur);
            if (it == subtree.tiles.end() || !visited.insert(cur).second)
                continue;
            if (it->second.is_pane())
            {
                new_children.push_back(cur);
                continue;
            }
            const auto& ch = it->second.children;
            for (auto c = ch.rbegin(); c != ch.rend(); ++c)
                stack.push_back(*c);
        }
        for (TileId pane : new_children)
            tiles_.emplace(pane, std::move(subtree.tiles.at(pane)));
    }
    else
    {
        new_children.push_back(subtree.root);
        for (auto& [id, tile] : subtree.tiles)
            tiles_.emplace(id, std::move(tile));
    }
    subtree = SubTree{};

    if (new_children.empty())
        return INVALID_TILE_ID;

    TileId result = new_children.front();
    Tile&  target = tiles_.at(at.parent);

    if (target.kind == at.kind)
    {
        size_t idx = std::min(at.index, target.children.size());
        target.children.insert(target.children.begin() + static_cast<std::ptrdiff_t>(idx),
                               new_children.begin(),
                               new_children.end());
        if (at.kind == TileKind::Tabs)
            target.active = result;
        splice_same_direction(at.parent);
        return result;
    }

    auto parent = parent_of(at.parent);
    if (parent && tiles_.at(*parent).kind == at.kind)
    {
        Tile&  p   = tiles_.at(*parent);
        size_t pos = static_cast<size_t>(
            std::find(p.children.begin(), p.children.end(), at.parent) - p.children.begin());
        size_t idx = at.index == 0 ? pos : pos + 1;
        p.children.insert(p.children.begin() + static_cast<std::ptrdiff_t>(idx),
                          new_children.begin(),
                          new_children.end());
        if (at.kind == TileKind::Tabs)
            p.active = result;
        splice_same_direction(*parent);
        return result;
    }

    TileId wrapper = allocator_->allocate();
    Tile   wrap{.kind = at.kind};
    if (at.index == 0)
    {
        wrap.children = new_children;
        wrap.children.push_back(at.parent);
    }
    else
    {
        wrap.children.push_back(at.parent);
        wrap.children.insert(wrap.children.end(), new_children.begin(), new_children.end());
    }
    if (at.kind == TileKind::Tabs)
        wrap.active = result;

    replace_child(parent, at.parent, wrapper);
    tiles_[wrapper] = std::move(wrap);
    splice_same_direction(wrapper);
    return result;
}

bool DockTree::move_within(TileId id, const InsertionPoint& at)
{
    if (!tiles_.count(id))
        return false;

    if (would_self_parent(at.parent, subtree_ids(id)))
    {
        DOCKBRIDGE_LOG_WARN(log_category::TREE, "move_within: tile {} cannot move under itself", id);
        return false;
    }

    // Extraction collapses a two-child linear parent into the remaining
    // child, which then stands where the parent was.  Otherwise the
    // siblings after the tile shift left by one.
    InsertionPoint target = at;
    if (auto parent = parent_of(id); parent && *parent == at.parent)
    {
        const Tile& p = tiles_.at(*parent);
        if (p.is_linear() && p.children.size() == 2)
        {
            target.parent = p.children[0] == id ? p.children[1] : p.children[0];
        }
        else if (p.kind == at.kind && at.index != INSERT_AT_END)
        {
            size_t old = static_cast<size_t>(
                std::find(p.children.begin(), p.children.end(), id) - p.children.begin());
            if (old < at.index)
                --target.index;
        }
    }

    DockTree backup = *this;
    auto     sub    = extract_subtree(id, false);
    if (!sub || !insert_subtree(*sub, target))
    {
        *this = std::move(backup);
        return false;
    }
    return true;
}

// ─── Layout ──────────────────────────────────────────────────────────────────

void DockTree::layout(const Rect& bounds, float tab_bar_height)
{
    bounds_         = bounds;
    tab_bar_height_ = tab_bar_height;
    rects_.clear();
    tab_bars_.clear();
    tab_buttons_.clear();
    if (root_)
        layout_tile(*root_, bounds);
}

void DockTree::layout_tile(TileId id, const Rect& rect)
{
    auto it = tiles_.find(id);
    if (it == tiles_.end() || rects_.count(id))
        return;
    rects_[id] = rect;

    const Tile& t = it->second;
    size_t      n = t.children.size();
    switch (t.kind)
    {
        case TileKind::Pane:
            break;
        case TileKind::Tabs:
        {
            float bar_h    = std::min(tab_bar_height_, rect.h);
            tab_bars_[id]  = Rect{rect.x, rect.y, rect.w, bar_h};
            if (n > 0)
            {
                float tab_w = std::min(TAB_MAX_WIDTH, rect.w / static_cast<float>(n));
                for (size_t i = 0; i < n; ++i)
                {
                    tab_buttons_[t.children[i]] =
                        Rect{rect.x + tab_w * static_cast<float>(i), rect.y, tab_w, bar_h};
                }
            }
            if (t.active != INVALID_TILE_ID)
                layout_tile(t.active, Rect{rect.x, rect.y + bar_h, rect.w, rect.h - bar_h});
            break;
        }
        case TileKind::Horizontal:
        {
            float w = n > 0 ? rect.w / static_cast<float>(n) : 0.0f;
            for (size_t i = 0; i < n; ++i)
                layout_tile(t.children[i], Rect{rect.x + w * static_cast<float>(i), rect.y, w, rect.h});
            break;
        }
        case TileKind::Vertical:
        {
            float h = n > 0 ? rect.h / static_cast<float>(n) : 0.0f;
            for (size_t i = 0; i < n; ++i)
                layout_tile(t.children[i], Rect{rect.x, rect.y + h * static_cast<float>(i), rect.w, h});
            break;
        }
    }
}

std::optional<Rect> DockTree::tile_rect(TileId id) const
{
    auto it = rects_.find(id);
    if (it == rects_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Rect> DockTree::tab_bar_rect(TileId tabs) const
{
    auto it = tab_bars_.find(tabs);
    if (it == tab_bars_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Rect> DockTree::tab_button_rect(TileId child) const
{
    auto it = tab_buttons_.find(child);
    if (it == tab_buttons_.end())
        return std::nullopt;
    return it->second;
}

size_t DockTree::tab_insertion_index(TileId tabs, float x) const
{
    const Tile* t = get(tabs);
    if (!t || t->kind != TileKind::Tabs)
        return INSERT_AT_END;

    size_t index = 0;
    for (TileId child : t->children)
    {
        auto r = tab_button_rect(child);
        if (r && r->center().x < x)
            ++index;
    }
    return index;
}

std::vector<TileId> DockTree::visible_tiles() const
{
    std::vector<TileId> out;
    out.reserve(rects_.size());
    for (const auto& [id, rect] : rects_)
        out.push_back(id);
    return out;
}

std::optional<TileId> DockTree::tabs_with_bar_at(const Vec2& p) const
{
    std::optional<TileId> best;
    float                 best_area = 0.0f;
    for (const auto& [id, bar] : tab_bars_)
    {
        if (bar.contains(p) && (!best || bar.area() < best_area))
        {
            best      = id;
            best_area = bar.area();
        }
    }
    return best;
}

std::optional<TileId> DockTree::tile_at(const Vec2& p) const
{
    std::optional<TileId> best;
    float                 best_area = 0.0f;
    for (const auto& [id, rect] : rects_)
    {
        if (rect.contains(p) && (!best || rect.area() < best_area))
        {
            best      = id;
            best_area = rect.area();
        }
    }
    return best;
}

// ─── Drag integration ────────────────────────────────────────────────────────

std::optional<DockZone> DockTree::dock_zone_at(const Vec2& p) const
{
    if (!root_ || !bounds_.contains(p))
        return std::nullopt;

    if (auto tabs = tabs_with_bar_at(p))
    {
        return DockZone{.preview   = tab_bars_.at(*tabs),
                        .insertion = {*tabs, TileKind::Tabs, tab_insertion_index(*tabs, p.x)}};
    }

    auto tile = tile_at(p);
    if (!tile)
        return std::nullopt;

    // A pane inside a tab group splits the whole group.
    TileId target = *tile;
    if (auto parent = parent_of(*tile); parent && tiles_.at(*parent).kind == TileKind::Tabs)
        target = *parent;

    Rect b = rects_.at(target);
    if (b.w < 1.0f || b.h < 1.0f)
        return std::nullopt;

    float edge_w = std::min(std::max(b.w * DROP_ZONE_FRACTION, DROP_ZONE_MIN_SIZE),
                            b.w * DROP_ZONE_MAX_FRACTION);
    float edge_h = std::min(std::max(b.h * DROP_ZONE_FRACTION, DROP_ZONE_MIN_SIZE),
                            b.h * DROP_ZONE_MAX_FRACTION);

    float rel_x = p.x - b.x;
    float rel_y = p.y - b.y;

    DockSide side = DockSide::Center;
    if (rel_x < edge_w)
        side = DockSide::Left;
    else if (rel_x > b.w - edge_w)
        side = DockSide::Right;
    else if (rel_y < edge_h)
        side = DockSide::Top;
    else if (rel_y > b.h - edge_h)
        side = DockSide::Bottom;

    return DockZone{.preview = side_preview_rect(b, side), .insertion = insertion_for_side(target, side)};
}

// ─── Diagnostics ─────────────────────────────────────────────────────────────

std::vector<std::string> DockTree::integrity_issues() const
{
    std::vector<std::string> issues;

    if (!root_)
    {
        if (!tiles_.empty())
            issues.push_back("root missing while " + std::to_string(tiles_.size())
                             + " tiles are present");
        return issues;
    }
    if (!tiles_.count(*root_))
    {
        issues.push_back("root tile " + std::to_string(*root_) + " is missing");
        return issues;
    }

    std::map<TileId, size_t> parent_count;
    for (const auto& [id, tile] : tiles_)
    {
        std::unordered_set<TileId> seen;
        for (TileId c : tile.children)
        {
            if (!seen.insert(c).second)
                issues.push_back("container " + std::to_string(id) + " lists child "
                                 + std::to_string(c) + " twice");
            if (!tiles_.count(c))
                issues.push_back("container " + std::to_string(id) + " references missing child "
                                 + std::to_string(c));
            ++parent_count[c];
        }

        if (tile.is_container() && tile.children.empty())
            issues.push_back("container " + std::to_string(id) + " is empty");

        if (tile.kind == TileKind::Tabs)
        {
            if (tile.active == INVALID_TILE_ID)
            {
                if (!tile.children.empty())
                    issues.push_back("tabs " + std::to_string(id) + " has no active tab");
            }
            else if (std::find(tile.children.begin(), tile.children.end(), tile.active)
                     == tile.children.end())
            {
                issues.push_back("tabs " + std::to_string(id) + " active tile "
                                 + std::to_string(tile.active) + " is not one of its children");
            }
        }
    }

    for (const auto& [id, count] : parent_count)
    {
        if (count > 1 && tiles_.count(id))
            issues.push_back("tile " + std::to_string(id) + " has " + std::to_string(count)
                             + " parents");
    }
    if (parent_count.count(*root_))
        issues.push_back("root tile " + std::to_string(*root_) + " has a parent");

    size_t reachable = subtree_ids(*root_).size();
    if (reachable < tiles_.size())
        issues.push_back(std::to_string(tiles_.size() - reachable) + " tiles are unreachable");

    return issues;
}

std::string DockTree::serialize() const
{
    std::ostringstream ss;
    ss << "{\"root\":" << (root_ ? std::to_string(*root_) : "null") << ",\"tiles\":[";
    bool first = true;
    for (const auto& [id, tile] : tiles_)
    {
        if (!first)
            ss << ",";
        first = false;
        ss << "{\"id\":" << id << ",\"kind\":\"" << tile_kind_name(tile.kind) << "\"";
        if (tile.is_pane())
        {
            ss << ",\"pane\":" << tile.pane;
        }
        else
        {
            ss << ",\"children\":[";
            for (size_t i = 0; i < tile.children.size(); ++i)
                ss << (i ? "," : "") << tile.children[i];
            ss << "]";
            if (tile.kind == TileKind::Tabs)
                ss << ",\"active\":" << tile.active;
        }
        ss << "}";
    }
    ss << "]}";
    return ss.str();
}

}   // namespace dockbridge
