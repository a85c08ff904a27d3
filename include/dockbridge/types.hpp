#pragma once

#include <algorithm>
#include <cmath>
#include <dockbridge/fwd.hpp>

namespace dockbridge
{

// ─── Vec2 ────────────────────────────────────────────────────────────────────

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    constexpr Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    constexpr bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }

    float length() const { return std::sqrt(x * x + y * y); }
};

// ─── Rect ────────────────────────────────────────────────────────────────────
// Top-left origin, y grows downward.

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;

    constexpr float right() const { return x + w; }
    constexpr float bottom() const { return y + h; }
    constexpr float area() const { return w * h; }
    constexpr Vec2  min() const { return {x, y}; }
    constexpr Vec2  center() const { return {x + w * 0.5f, y + h * 0.5f}; }
    constexpr bool  is_positive() const { return w > 0.0f && h > 0.0f; }

    constexpr bool contains(const Vec2& p) const
    {
        return p.x >= x && p.x <= x + w && p.y >= y && p.y <= y + h;
    }

    constexpr Rect expand(float amount) const
    {
        return {x - amount, y - amount, w + amount * 2.0f, h + amount * 2.0f};
    }

    constexpr Rect translate(const Vec2& d) const { return {x + d.x, y + d.y, w, h}; }

    Rect intersect(const Rect& o) const
    {
        float l = std::max(x, o.x);
        float t = std::max(y, o.y);
        float r = std::min(right(), o.right());
        float b = std::min(bottom(), o.bottom());
        return {l, t, std::max(0.0f, r - l), std::max(0.0f, b - t)};
    }

    // Distance from p to the closest point of the rect (0 when inside).
    float distance_to(const Vec2& p) const
    {
        float dx = std::max({x - p.x, 0.0f, p.x - right()});
        float dy = std::max({y - p.y, 0.0f, p.y - bottom()});
        return std::sqrt(dx * dx + dy * dy);
    }

    constexpr bool operator==(const Rect& o) const
    {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }

    static constexpr Rect from_center_size(const Vec2& c, float size)
    {
        return {c.x - size * 0.5f, c.y - size * 0.5f, size, size};
    }
};

// ─── Modifiers ───────────────────────────────────────────────────────────────

struct Modifiers
{
    bool shift = false;
    bool ctrl  = false;
    bool alt   = false;

    constexpr bool operator==(const Modifiers& o) const
    {
        return shift == o.shift && ctrl == o.ctrl && alt == o.alt;
    }
};

}   // namespace dockbridge
