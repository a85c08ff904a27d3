#include "floating_manager.hpp"

#include <algorithm>

namespace dockbridge
{

FloatingWindow& FloatingManager::add(FloatingId id, DockTree tree, const Vec2& offset, const Vec2& size)
{
    remove(id);
    FloatingWindow w{.id = id, .tree = std::move(tree), .offset = offset, .size = size};
    auto [it, inserted] = windows_.emplace(id, std::move(w));
    z_order_.push_back(id);
    return it->second;
}

bool FloatingManager::remove(FloatingId id)
{
    if (windows_.erase(id) == 0)
        return false;
    z_order_.erase(std::remove(z_order_.begin(), z_order_.end(), id), z_order_.end());
    return true;
}

FloatingWindow* FloatingManager::get(FloatingId id)
{
    auto it = windows_.find(id);
    return it != windows_.end() ? &it->second : nullptr;
}

const FloatingWindow* FloatingManager::get(FloatingId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? &it->second : nullptr;
}

void FloatingManager::bring_to_front(FloatingId id)
{
    auto it = std::find(z_order_.begin(), z_order_.end(), id);
    if (it == z_order_.end())
        return;
    z_order_.erase(it);
    z_order_.push_back(id);
}

std::vector<FloatingRect> FloatingManager::hit_rects(float title_height) const
{
    std::vector<FloatingRect> rects;
    rects.reserve(z_order_.size());
    for (FloatingId id : z_order_)
    {
        const auto& w = windows_.at(id);
        rects.push_back({id, w.outer_rect(title_height), w.content_rect(title_height)});
    }
    return rects;
}

void FloatingManager::layout(float title_height, float tab_bar_height)
{
    for (auto& [id, w] : windows_)
        w.tree.layout(w.content_rect(title_height), tab_bar_height);
}

std::vector<FloatingId> FloatingManager::empty_windows() const
{
    std::vector<FloatingId> out;
    for (const auto& [id, w] : windows_)
    {
        if (w.tree.is_empty())
            out.push_back(id);
    }
    return out;
}

}   // namespace dockbridge
