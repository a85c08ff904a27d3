#pragma once

#include <algorithm>
#include <dockbridge/fwd.hpp>
#include <dockbridge/types.hpp>
#include <map>
#include <vector>

#include "geometry_cache.hpp"
#include "tree/dock_tree.hpp"

namespace dockbridge
{

// ─── FloatingWindow ──────────────────────────────────────────────────────────
// A window drawn inside a viewport (not an OS window).  Holds its own tree;
// positions are viewport-local.

struct FloatingWindow
{
    FloatingId id = 0;
    DockTree   tree;
    Vec2       offset{};   // top-left of the outer rect
    Vec2       size{};
    bool       collapsed = false;

    Rect outer_rect(float title_height) const
    {
        return {offset.x, offset.y, size.x, collapsed ? title_height : size.y};
    }

    Rect content_rect(float title_height) const
    {
        if (collapsed)
            return {offset.x, offset.y + title_height, size.x, 0.0f};
        return {offset.x, offset.y + title_height, size.x, std::max(0.0f, size.y - title_height)};
    }
};

// ─── FloatingManager ─────────────────────────────────────────────────────────
// Floating windows of one viewport, with their z-order (back to front).

class FloatingManager
{
   public:
    FloatingManager()  = default;
    ~FloatingManager() = default;

    FloatingManager(FloatingManager&&)            = default;
    FloatingManager& operator=(FloatingManager&&) = default;

    // Adds on top of the z-order.
    FloatingWindow& add(FloatingId id, DockTree tree, const Vec2& offset, const Vec2& size);
    bool            remove(FloatingId id);

    FloatingWindow*       get(FloatingId id);
    const FloatingWindow* get(FloatingId id) const;

    void bring_to_front(FloatingId id);

    const std::vector<FloatingId>& z_order() const { return z_order_; }
    bool                           empty() const { return windows_.empty(); }
    size_t                         size() const { return windows_.size(); }

    // Hit-test rects in z-order for the geometry cache.
    std::vector<FloatingRect> hit_rects(float title_height) const;

    // Lay out every window's tree inside its content rect.
    void layout(float title_height, float tab_bar_height);

    // Ids of windows whose tree became empty.
    std::vector<FloatingId> empty_windows() const;

   private:
    std::map<FloatingId, FloatingWindow> windows_;
    std::vector<FloatingId>              z_order_;
};

}   // namespace dockbridge
