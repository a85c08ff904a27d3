#pragma once

#include <dockbridge/types.hpp>
#include <optional>
#include <vector>

namespace dockbridge
{

// Monitor a window rect belongs to: the one it overlaps most, else the
// nearest one.  nullopt when no monitors are known.
std::optional<Rect> monitor_for_rect(const Rect& window, const std::vector<Rect>& monitors);

// Keep a window of `size` at `position` fully on its monitor where it fits;
// a window larger than the monitor is pinned to the monitor's top-left.
Vec2 clamp_to_monitors(const Vec2& position, const Vec2& size, const std::vector<Rect>& monitors);

}   // namespace dockbridge
