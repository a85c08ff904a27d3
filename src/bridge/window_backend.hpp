#pragma once

#include <dockbridge/fwd.hpp>
#include <dockbridge/options.hpp>
#include <dockbridge/types.hpp>
#include <string>

namespace dockbridge
{

// Builder record of a detached viewport: where and how the windowing layer
// should present it.  Positions and sizes are global (screen) units.
struct ViewportPlacement
{
    Vec2           position{};   // outer top-left
    Vec2           size{};       // inner size
    std::string    title;
    DecorationMode decoration = DecorationMode::OsDecorated;
    bool           maximized  = false;
    bool           fullscreen = false;

    bool operator==(const ViewportPlacement& o) const
    {
        return position == o.position && size == o.size && title == o.title
               && decoration == o.decoration && maximized == o.maximized
               && fullscreen == o.fullscreen;
    }
};

// ─── WindowBackend ───────────────────────────────────────────────────────────
// Windowing layer the bridge drives.  All calls happen on the UI thread,
// inside DockingBridge::run_frame().

class WindowBackend
{
   public:
    virtual ~WindowBackend() = default;

    // Returns false if the window could not be created; the bridge then
    // keeps the content where it was.
    virtual bool create_window(ViewportId id, const ViewportPlacement& placement) = 0;

    virtual void set_window_placement(ViewportId id, const ViewportPlacement& placement) = 0;

    // Hand the current pointer drag to the window system (OS-decorated
    // windows are moved by the OS).
    virtual void begin_native_drag_move(ViewportId id) = 0;

    virtual void destroy_window(ViewportId id) = 0;
};

}   // namespace dockbridge
