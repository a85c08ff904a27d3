#ifdef DOCKBRIDGE_USE_IMGUI

    #include "imgui_overlay.hpp"

namespace dockbridge
{

static ImU32 with_alpha(ImU32 color, int alpha)
{
    return (color & ~IM_COL32_A_MASK) | (static_cast<ImU32>(alpha) << IM_COL32_A_SHIFT);
}

void ImGuiOverlayPainter::fill_rect(ImDrawList* dl,
                                    const Rect& r,
                                    const Vec2& origin,
                                    ImU32       color,
                                    int         fill_alpha,
                                    int         border_alpha) const
{
    ImVec2 p0(origin.x + r.x, origin.y + r.y);
    ImVec2 p1(origin.x + r.right(), origin.y + r.bottom());
    dl->AddRectFilled(p0, p1, with_alpha(color, fill_alpha), style_.rounding);
    dl->AddRect(p0, p1, with_alpha(color, border_alpha), style_.rounding, 0, style_.border);
}

void ImGuiOverlayPainter::paint(const ViewportFrameOutput& output,
                                ImDrawList*                dl,
                                const Vec2&                origin) const
{
    if (!dl)
        return;

    if (output.tree_preview_rect && !output.suppress_tree_preview)
        fill_rect(dl, *output.tree_preview_rect, origin, style_.tree_preview, 30, 120);

    if (output.preview_rect)
        fill_rect(dl, *output.preview_rect, origin, style_.accent, 40, 160);

    if (!output.overlay)
        return;
    for (const auto& target : output.overlay->targets)
    {
        bool hovered = output.hovered && *output.hovered == target.side;
        fill_rect(dl, target.rect, origin, style_.accent, hovered ? 170 : 90, hovered ? 255 : 180);
    }
}

void ImGuiOverlayPainter::paint(const ViewportFrameOutput& output) const
{
    paint(output, ImGui::GetForegroundDrawList(), Vec2{});
}

}   // namespace dockbridge

#endif   // DOCKBRIDGE_USE_IMGUI
