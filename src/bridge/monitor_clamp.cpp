#include "monitor_clamp.hpp"

#include <algorithm>
#include <limits>

namespace dockbridge
{

std::optional<Rect> monitor_for_rect(const Rect& window, const std::vector<Rect>& monitors)
{
    std::optional<Rect> best;
    float               best_overlap = 0.0f;
    for (const auto& m : monitors)
    {
        float overlap = window.intersect(m).area();
        if (overlap > best_overlap)
        {
            best_overlap = overlap;
            best         = m;
        }
    }
    if (best)
        return best;

    float best_dist = std::numeric_limits<float>::max();
    for (const auto& m : monitors)
    {
        float d = m.distance_to(window.center());
        if (d < best_dist)
        {
            best_dist = d;
            best      = m;
        }
    }
    return best;
}

Vec2 clamp_to_monitors(const Vec2& position, const Vec2& size, const std::vector<Rect>& monitors)
{
    auto monitor = monitor_for_rect(Rect{position.x, position.y, size.x, size.y}, monitors);
    if (!monitor)
        return position;

    const Rect& m = *monitor;
    float max_x = std::max(m.x, m.right() - size.x);
    float max_y = std::max(m.y, m.bottom() - size.y);
    return {std::clamp(position.x, m.x, max_x), std::clamp(position.y, m.y, max_y)};
}

}   // namespace dockbridge
