#pragma once

#ifdef DOCKBRIDGE_USE_IMGUI

    #include <dockbridge/types.hpp>
    #include <imgui.h>

    #include "bridge/docking_bridge.hpp"

namespace dockbridge
{

struct OverlayStyle
{
    ImU32 accent       = IM_COL32(80, 140, 255, 255);
    ImU32 tree_preview = IM_COL32(200, 200, 210, 255);
    float rounding     = 4.0f;
    float border       = 1.5f;
};

// Paints one viewport's drop preview and overlay targets.  The tree's own
// reorder preview is painted only when the bridge did not suppress it.
class ImGuiOverlayPainter
{
   public:
    ImGuiOverlayPainter() = default;
    explicit ImGuiOverlayPainter(const OverlayStyle& style) : style_(style) {}

    // `origin` is the screen position of the viewport's local (0, 0).
    void paint(const ViewportFrameOutput& output, ImDrawList* draw_list, const Vec2& origin) const;

    // Into the current context's foreground draw list; one ImGui context
    // per viewport window, so local coordinates are screen coordinates.
    void paint(const ViewportFrameOutput& output) const;

    const OverlayStyle& style() const { return style_; }

   private:
    void fill_rect(ImDrawList* dl, const Rect& r, const Vec2& origin, ImU32 color, int fill_alpha, int border_alpha) const;

    OverlayStyle style_;
};

}   // namespace dockbridge

#endif   // DOCKBRIDGE_USE_IMGUI
