#include "authority_policy.hpp"

#include <algorithm>

namespace dockbridge
{

const char* authority_name(Authority authority)
{
    switch (authority)
    {
        case Authority::None:
            return "none";
        case Authority::Tree:
            return "tree";
        case Authority::Bridge:
            return "bridge";
    }
    return "unknown";
}

std::optional<TileId> AuthorityPolicy::overlay_tile(const DockTree&       tree,
                                                    const Vec2&           pointer_local,
                                                    std::optional<TileId> dragged) const
{
    auto tile = tree.tile_at(pointer_local);
    if (!tile)
        return std::nullopt;

    if (dragged && *tile == *dragged)
    {
        if (auto parent = tree.parent_of(*tile); parent && tree.tile_rect(*parent))
            return parent;
        if (auto root = tree.root(); root && tree.tile_rect(*root))
            return root;
    }
    return tile;
}

std::optional<DockZone> AuthorityPolicy::window_move_zone(const DockTree& tree,
                                                          const Vec2&     pointer_local) const
{
    auto hit = tree.tile_at(pointer_local);
    if (!hit)
        return std::nullopt;

    TileId header = *hit;
    if (auto parent = tree.parent_of(*hit))
    {
        const Tile* p = tree.get(*parent);
        if (p && p->kind == TileKind::Tabs)
            header = *parent;
    }

    auto header_rect = tree.tile_rect(header);
    if (!header_rect)
        return std::nullopt;

    float band_h = std::clamp(tree.tab_bar_height(), 0.0f, header_rect->h);
    Rect  band{header_rect->x, header_rect->y, header_rect->w, band_h};
    if (!band.contains(pointer_local))
        return std::nullopt;

    const Tile* h = tree.get(header);
    if (h && h->kind == TileKind::Tabs)
    {
        return DockZone{
            .preview   = band,
            .insertion = {header, TileKind::Tabs, tree.tab_insertion_index(header, pointer_local.x)}};
    }
    return DockZone{.preview = band, .insertion = {header, TileKind::Tabs, INSERT_AT_END}};
}

OverlayDecision AuthorityPolicy::decide(const DockTree&       tree,
                                        const Rect&           dock_rect,
                                        const Vec2&           pointer_local,
                                        DragKind              kind,
                                        std::optional<TileId> dragged,
                                        const Modifiers&      modifiers) const
{
    OverlayDecision d;

    if (kind == DragKind::WindowMove && !options_->docking_enabled(modifiers.shift))
    {
        d.gated = true;
        return d;
    }
    if (!dock_rect.contains(pointer_local))
        return d;

    if (tree.is_empty())
    {
        if (kind == DragKind::ExternalSubtree)
        {
            d.authority       = Authority::Bridge;
            d.into_empty_tree = true;
            d.preview_rect    = dock_rect;
        }
        return d;
    }

    const OverlayMetrics& m       = options_->overlay;
    auto                  wm_zone = window_move_zone(tree, pointer_local);

    // Tab bars often sit inside the outer band; tabbing wins over outer splits.
    bool outer_mode = options_->show_outer_overlay_targets
                      && pointer_in_outer_band(dock_rect, pointer_local, m) && !wm_zone;

    std::optional<OverlayTargets> targets;
    TileId                        anchor = INVALID_TILE_ID;
    if (outer_mode)
    {
        targets = outer_overlay_targets(dock_rect, m);
        anchor  = *tree.root();
    }
    else if (auto tile = overlay_tile(tree,
                                      pointer_local,
                                      kind == DragKind::InternalSubtree ? dragged : std::nullopt))
    {
        const Tile*             t = tree.get(*tile);
        std::optional<TileKind> tile_kind;
        if (t && t->is_container())
            tile_kind = t->kind;
        targets = inner_overlay_targets(*tree.tile_rect(*tile), tile_kind, m);
        anchor  = *tile;
    }

    std::optional<OverlayTarget> hit;
    if (targets)
    {
        hit = hit_test_boxes(*targets, pointer_local, m);
        if (!hit && kind == DragKind::ExternalSubtree)
            hit = hit_test_radial(*targets, pointer_local, m);
    }
    if (hit)
    {
        d.insertion_explicit = insertion_for_side(anchor, hit->side);
        d.hovered            = hit->side;
    }

    // An internal drag may never land inside itself.
    if (kind == DragKind::InternalSubtree && dragged && d.insertion_explicit
        && tree.is_descendant_or_self(*dragged, d.insertion_explicit->parent))
    {
        d.insertion_explicit.reset();
        d.hovered.reset();
    }

    bool paint = kind != DragKind::InternalSubtree || d.insertion_explicit.has_value();
    if (paint)
        d.paint = targets;

    switch (kind)
    {
        case DragKind::WindowMove:
            d.fallback_zone = wm_zone;
            break;
        case DragKind::ExternalSubtree:
            d.fallback_zone = tree.dock_zone_at(pointer_local);
            break;
        case DragKind::InternalSubtree:
        {
            auto zone = tree.dock_zone_at(pointer_local);
            if (zone && !(dragged && tree.is_descendant_or_self(*dragged, zone->insertion.parent)))
                d.tree_zone = zone;
            break;
        }
    }

    if (d.insertion_explicit)
        d.insertion_final = d.insertion_explicit;
    else if (kind != DragKind::InternalSubtree && d.fallback_zone)
        d.insertion_final = d.fallback_zone->insertion;

    switch (kind)
    {
        case DragKind::WindowMove:
            d.authority = d.insertion_final ? Authority::Bridge : Authority::None;
            break;
        case DragKind::ExternalSubtree:
            d.authority = Authority::Bridge;
            break;
        case DragKind::InternalSubtree:
            d.authority             = d.insertion_explicit ? Authority::Bridge : Authority::Tree;
            d.suppress_tree_preview = d.insertion_explicit.has_value();
            break;
    }

    if (d.authority == Authority::Bridge)
    {
        if (d.insertion_explicit && targets && d.hovered)
            d.preview_rect = overlay_preview_rect(*targets, *d.hovered);
        else if (d.fallback_zone && d.insertion_final)
            d.preview_rect = d.fallback_zone->preview;
    }
    return d;
}

}   // namespace dockbridge
