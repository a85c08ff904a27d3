#pragma once

#include <cstdint>
#include <dockbridge/fwd.hpp>
#include <dockbridge/types.hpp>
#include <map>
#include <optional>
#include <vector>

namespace dockbridge
{

// Hit-test rects of one contained floating window, viewport-local.
struct FloatingRect
{
    FloatingId id = 0;
    Rect       outer{};     // title bar + content
    Rect       content{};   // dock area of the window's tree
};

// Everything hit-testing needs about one viewport for the current frame.
struct ViewportGeometry
{
    std::optional<Rect>       inner_rect;   // global; unknown until the backend reports it
    Rect                      dock_rect{};  // viewport-local
    std::vector<FloatingRect> floating;     // back to front
};

// ─── GeometryCache ───────────────────────────────────────────────────────────
// Per-frame record of the rectangles the trees do not lay out themselves.
// Rebuilt at the start of every frame; queries are answered only once the
// rebuild for the current frame is sealed, so every hit-test of a frame sees
// the same snapshot.

class GeometryCache
{
   public:
    GeometryCache()  = default;
    ~GeometryCache() = default;

    GeometryCache(const GeometryCache&)            = delete;
    GeometryCache& operator=(const GeometryCache&) = delete;

    // ── Rebuild ─────────────────────────────────────────────────────────

    void begin_rebuild(uint64_t frame);
    void set_viewport(ViewportId id, ViewportGeometry geometry);
    void seal();

    bool     is_ready() const { return sealed_; }
    uint64_t frame() const { return frame_; }

    // ── Queries ─────────────────────────────────────────────────────────

    // Topmost floating window under a viewport-local point (the last one
    // written wins when windows overlap).
    std::optional<FloatingId> rect_at(ViewportId viewport, const Vec2& local) const;
    std::optional<FloatingId> rect_at_excluding(ViewportId               viewport,
                                                const Vec2&              local,
                                                std::optional<FloatingId> exclude) const;

    const ViewportGeometry* viewport(ViewportId id) const;
    const FloatingRect*     floating(ViewportId viewport, FloatingId id) const;
    std::vector<ViewportId> viewports() const;

    // Smallest viewport whose inner rect contains the global point.
    std::optional<ViewportId> viewport_at_global(const Vec2&               global,
                                                 std::optional<ViewportId> exclude = {}) const;

    std::optional<Vec2> to_local(ViewportId viewport, const Vec2& global) const;
    std::optional<Vec2> to_global(ViewportId viewport, const Vec2& local) const;

    // Inner rect reported on some earlier frame; survives rebuilds.
    std::optional<Rect> last_known_inner_rect(ViewportId viewport) const;

    void forget(ViewportId viewport);

   private:
    bool check_ready(const char* query) const;

    std::map<ViewportId, ViewportGeometry> viewports_;
    std::map<ViewportId, Rect>             last_inner_;
    uint64_t                               frame_  = 0;
    bool                                   sealed_ = false;
};

}   // namespace dockbridge
