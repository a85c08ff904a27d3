#include "overlay.hpp"

#include <algorithm>
#include <cmath>

namespace dockbridge
{

namespace
{

float clamp_size(float value, float lo, float hi)
{
    return std::clamp(value, lo, std::max(lo, hi));
}

void push_clipped(OverlayTargets& out, DockSide side, const Rect& box, const Rect& clip)
{
    Rect r = box.intersect(clip);
    if (r.is_positive())
        out.targets.push_back({side, r});
}

}   // namespace

OverlayTargets inner_overlay_targets(const Rect&             tile_rect,
                                     std::optional<TileKind> tile_kind,
                                     const OverlayMetrics&   m)
{
    OverlayTargets out;
    out.anchor = tile_rect;

    float min_dim = std::min(tile_rect.w, tile_rect.h);
    float size = clamp_size(min_dim * m.inner_size_fraction, m.inner_size_min, m.inner_size_max);
    float gap  = clamp_size(size * m.inner_gap_fraction, m.inner_gap_min, m.inner_gap_max);

    bool allow_lr = tile_kind != TileKind::Horizontal;
    bool allow_tb = tile_kind != TileKind::Vertical;

    Vec2  c    = tile_rect.center();
    float step = size + gap;

    // Center first: it is always present and sizes the hit slop.
    push_clipped(out, DockSide::Center, Rect::from_center_size(c, size), tile_rect);
    if (allow_lr)
    {
        push_clipped(out, DockSide::Left, Rect::from_center_size({c.x - step, c.y}, size), tile_rect);
        push_clipped(out, DockSide::Right, Rect::from_center_size({c.x + step, c.y}, size), tile_rect);
    }
    if (allow_tb)
    {
        push_clipped(out, DockSide::Top, Rect::from_center_size({c.x, c.y - step}, size), tile_rect);
        push_clipped(out, DockSide::Bottom, Rect::from_center_size({c.x, c.y + step}, size), tile_rect);
    }
    return out;
}

bool pointer_in_outer_band(const Rect& dock_rect, const Vec2& p, const OverlayMetrics& m)
{
    if (!dock_rect.contains(p))
        return false;

    float min_dim = std::min(dock_rect.w, dock_rect.h);
    if (min_dim <= 0.0f)
        return false;

    float band = clamp_size(min_dim * m.outer_band_fraction, m.outer_band_min, m.outer_band_max);
    float dx   = std::min(p.x - dock_rect.x, dock_rect.right() - p.x);
    float dy   = std::min(p.y - dock_rect.y, dock_rect.bottom() - p.y);
    return std::min(dx, dy) <= band;
}

std::optional<OverlayTargets> outer_overlay_targets(const Rect& dock_rect, const OverlayMetrics& m)
{
    float min_dim = std::min(dock_rect.w, dock_rect.h);
    if (min_dim <= 0.0f)
        return std::nullopt;

    float size   = clamp_size(min_dim * m.outer_size_fraction, m.outer_size_min, m.outer_size_max);
    float hs     = size * 0.5f;
    float margin = clamp_size(size * m.outer_margin_fraction, m.outer_margin_min, m.outer_margin_max);

    Vec2 c{dock_rect.center()};
    Vec2 left{dock_rect.x + margin + hs, c.y};
    Vec2 right{dock_rect.right() - margin - hs, c.y};
    Vec2 top{c.x, dock_rect.y + margin + hs};
    Vec2 bottom{c.x, dock_rect.bottom() - margin - hs};

    // Too small to place four separate buttons.
    if (left.x + hs >= right.x - hs || top.y + hs >= bottom.y - hs)
        return std::nullopt;

    OverlayTargets out;
    out.outer  = true;
    out.anchor = dock_rect;
    push_clipped(out, DockSide::Left, Rect::from_center_size(left, size), dock_rect);
    push_clipped(out, DockSide::Right, Rect::from_center_size(right, size), dock_rect);
    push_clipped(out, DockSide::Top, Rect::from_center_size(top, size), dock_rect);
    push_clipped(out, DockSide::Bottom, Rect::from_center_size(bottom, size), dock_rect);
    if (out.targets.size() != 4)
        return std::nullopt;
    return out;
}

std::optional<OverlayTarget> hit_test_boxes(const OverlayTargets& targets,
                                            const Vec2&           p,
                                            const OverlayMetrics& m)
{
    float hs     = targets.half_size();
    float expand = hs > 0.0f ? std::round(hs * m.hit_expand_fraction) : 0.0f;
    for (const auto& t : targets.targets)
    {
        if (t.rect.expand(expand).contains(p))
            return t;
    }
    return std::nullopt;
}

std::optional<OverlayTarget> hit_test_radial(const OverlayTargets& targets,
                                             const Vec2&           p,
                                             const OverlayMetrics& m)
{
    auto find_side = [&](DockSide side) -> std::optional<OverlayTarget>
    {
        for (const auto& t : targets.targets)
        {
            if (t.side == side)
                return t;
        }
        return std::nullopt;
    };

    float hs = targets.half_size();
    if (hs > 0.0f)
    {
        Vec2  d    = p - targets.anchor.center();
        float len2 = d.x * d.x + d.y * d.y;

        float r_center = hs * m.radial_center_factor;
        float r_sides  = hs * m.radial_side_factor;

        if (!targets.outer && len2 < r_center * r_center)
            return find_side(DockSide::Center);

        if (len2 < r_sides * r_sides)
        {
            std::optional<OverlayTarget> hit;
            if (std::abs(d.x) >= std::abs(d.y))
                hit = find_side(d.x < 0.0f ? DockSide::Left : DockSide::Right);
            else
                hit = find_side(d.y < 0.0f ? DockSide::Top : DockSide::Bottom);
            if (hit)
                return hit;
        }
    }
    return hit_test_boxes(targets, p, m);
}

Rect overlay_preview_rect(const OverlayTargets& targets, DockSide side)
{
    return side_preview_rect(targets.anchor, side);
}

}   // namespace dockbridge
