#include "geometry_cache.hpp"

#include <dockbridge/logger.hpp>

namespace dockbridge
{

void GeometryCache::begin_rebuild(uint64_t frame)
{
    frame_  = frame;
    sealed_ = false;
    viewports_.clear();
}

void GeometryCache::set_viewport(ViewportId id, ViewportGeometry geometry)
{
    if (sealed_)
    {
        DOCKBRIDGE_LOG_WARN(log_category::GEOMETRY,
                            "set_viewport({}) after seal on frame {}; ignored",
                            id,
                            frame_);
        return;
    }
    if (geometry.inner_rect)
        last_inner_[id] = *geometry.inner_rect;
    viewports_[id] = std::move(geometry);
}

void GeometryCache::seal()
{
    sealed_ = true;
}

bool GeometryCache::check_ready(const char* query) const
{
    if (!sealed_)
    {
        DOCKBRIDGE_LOG_WARN(log_category::GEOMETRY, "{} queried before the frame {} rebuild", query, frame_);
        return false;
    }
    return true;
}

std::optional<FloatingId> GeometryCache::rect_at(ViewportId viewport, const Vec2& local) const
{
    return rect_at_excluding(viewport, local, std::nullopt);
}

std::optional<FloatingId> GeometryCache::rect_at_excluding(ViewportId                viewport,
                                                           const Vec2&               local,
                                                           std::optional<FloatingId> exclude) const
{
    if (!check_ready("rect_at"))
        return std::nullopt;

    auto it = viewports_.find(viewport);
    if (it == viewports_.end())
        return std::nullopt;

    const auto& windows = it->second.floating;
    for (auto w = windows.rbegin(); w != windows.rend(); ++w)
    {
        if (exclude && w->id == *exclude)
            continue;
        if (w->outer.contains(local))
            return w->id;
    }
    return std::nullopt;
}

const ViewportGeometry* GeometryCache::viewport(ViewportId id) const
{
    auto it = viewports_.find(id);
    return it != viewports_.end() ? &it->second : nullptr;
}

const FloatingRect* GeometryCache::floating(ViewportId viewport, FloatingId id) const
{
    const auto* vp = this->viewport(viewport);
    if (!vp)
        return nullptr;
    for (const auto& w : vp->floating)
    {
        if (w.id == id)
            return &w;
    }
    return nullptr;
}

std::vector<ViewportId> GeometryCache::viewports() const
{
    std::vector<ViewportId> ids;
    ids.reserve(viewports_.size());
    for (const auto& [id, geometry] : viewports_)
        ids.push_back(id);
    return ids;
}

std::optional<ViewportId> GeometryCache::viewport_at_global(const Vec2&               global,
                                                            std::optional<ViewportId> exclude) const
{
    if (!check_ready("viewport_at_global"))
        return std::nullopt;

    std::optional<ViewportId> best;
    float                     best_area = 0.0f;
    for (const auto& [id, geometry] : viewports_)
    {
        if (exclude && id == *exclude)
            continue;
        if (!geometry.inner_rect || !geometry.inner_rect->contains(global))
            continue;
        float area = geometry.inner_rect->area();
        if (!best || area < best_area)
        {
            best      = id;
            best_area = area;
        }
    }
    return best;
}

std::optional<Vec2> GeometryCache::to_local(ViewportId viewport, const Vec2& global) const
{
    auto inner = last_known_inner_rect(viewport);
    if (!inner)
        return std::nullopt;
    return global - inner->min();
}

std::optional<Vec2> GeometryCache::to_global(ViewportId viewport, const Vec2& local) const
{
    auto inner = last_known_inner_rect(viewport);
    if (!inner)
        return std::nullopt;
    return local + inner->min();
}

std::optional<Rect> GeometryCache::last_known_inner_rect(ViewportId viewport) const
{
    if (auto it = viewports_.find(viewport); it != viewports_.end() && it->second.inner_rect)
        return it->second.inner_rect;
    auto it = last_inner_.find(viewport);
    if (it == last_inner_.end())
        return std::nullopt;
    return it->second;
}

void GeometryCache::forget(ViewportId viewport)
{
    viewports_.erase(viewport);
    last_inner_.erase(viewport);
}

}   // namespace dockbridge
