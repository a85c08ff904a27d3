#pragma once

#include <dockbridge/fwd.hpp>
#include <dockbridge/types.hpp>
#include <optional>
#include <vector>

namespace dockbridge
{

// Optional platform hints.  Every field may be absent; the bridge then falls
// back to geometry-only inference.
struct BackendHints
{
    std::optional<ViewportId>        hovered_viewport;   // viewport under the global pointer
    std::optional<Vec2>              pointer_global;     // screen-independent units
    std::optional<std::vector<Rect>> monitors;           // work areas, for clamping
};

// What one viewport observed this frame.
struct ViewportInput
{
    ViewportId          viewport = ROOT_VIEWPORT_ID;
    std::optional<Rect> inner_rect;      // global
    std::optional<Rect> dock_rect;       // local; defaults to the whole inner rect
    std::optional<Vec2> pointer_local;   // pointer as seen by this viewport
    bool                primary_down     = false;
    bool                primary_released = false;   // release delivered to this viewport
    Modifiers           modifiers;
};

struct FrameInput
{
    std::vector<ViewportInput> viewports;
    BackendHints               hints;
};

// Pointer state the drop resolution works from.
struct PointerState
{
    std::optional<Vec2>       global;
    std::optional<ViewportId> hovered;   // trusted hovered-viewport hint
    Modifiers                 modifiers;

    bool operator==(const PointerState& o) const
    {
        return global == o.global && hovered == o.hovered && modifiers == o.modifiers;
    }
};

}   // namespace dockbridge
