// Headless walk-through of a tear-off and re-dock.  The window backend only
// logs what a real windowing layer would be asked to do.

#include <dockbridge/logger.hpp>
#include <iostream>
#include <map>
#include <optional>
#include <string>

#include "bridge/docking_bridge.hpp"

using namespace dockbridge;

class LoggingBackend : public WindowBackend
{
   public:
    bool create_window(ViewportId id, const ViewportPlacement& p) override
    {
        DOCKBRIDGE_LOG_INFO("demo", "create window {} at ({}, {}) '{}'", id, p.position.x, p.position.y, p.title);
        placements[id] = p;
        return true;
    }
    void set_window_placement(ViewportId id, const ViewportPlacement& p) override { placements[id] = p; }
    void begin_native_drag_move(ViewportId id) override
    {
        DOCKBRIDGE_LOG_INFO("demo", "native move of window {}", id);
    }
    void destroy_window(ViewportId id) override
    {
        DOCKBRIDGE_LOG_INFO("demo", "destroy window {}", id);
        placements.erase(id);
    }

    std::map<ViewportId, ViewportPlacement> placements;
};

static const Rect ROOT_INNER{0, 0, 1024, 768};

// One frame: every viewport reports its rect; `button_in` holds or releases
// the primary button.
static FrameOutput step(DockingBridge&            bridge,
                        LoggingBackend&           backend,
                        const Vec2&               pointer,
                        std::optional<ViewportId> button_in,
                        bool                      released)
{
    FrameInput input;
    for (ViewportId id : bridge.model().viewport_ids())
    {
        ViewportInput vi;
        vi.viewport = id;
        if (id == ROOT_VIEWPORT_ID)
            vi.inner_rect = ROOT_INNER;
        else if (auto it = backend.placements.find(id); it != backend.placements.end())
            vi.inner_rect = Rect{it->second.position.x, it->second.position.y, it->second.size.x, it->second.size.y};
        if (vi.inner_rect)
            vi.pointer_local = pointer - vi.inner_rect->min();
        if (button_in == id)
        {
            vi.primary_down     = !released;
            vi.primary_released = released;
        }
        input.viewports.push_back(vi);
    }
    input.hints.pointer_global = pointer;
    input.hints.monitors       = std::vector<Rect>{{0, 0, 2560, 1440}};
    return bridge.run_frame(input);
}

static void report(const FrameOutput& out)
{
    if (!out.drop)
        return;
    std::cout << "drop: " << drop_outcome_name(out.drop->kind) << " via "
              << drop_phase_name(out.drop->resolved) << "\n";
}

int main()
{
    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::console_sink());

    LoggingBackend backend;
    DockingOptions options;
    DockingBridge  bridge(1, options, &backend);
    bridge.set_title_provider([](PaneId pane) { return "Figure " + std::to_string(pane); });

    DockTree& root = bridge.model().root_tree();
    TileId    a    = root.add_pane(1);
    TileId    b    = root.add_pane(2);
    TileId    c    = root.add_pane(3);
    root.set_root(root.add_container(TileKind::Horizontal, {a, root.add_container(TileKind::Tabs, {b, c})}));
    step(bridge, backend, {10, 10}, std::nullopt, false);
    std::cout << "initial: " << bridge.model().serialize() << "\n";

    // Drag Figure 1 off the main window and let go outside it.
    bridge.begin_tile_drag(ROOT_VIEWPORT_ID, std::nullopt, a, {200, 300});
    step(bridge, backend, {1400, 300}, ROOT_VIEWPORT_ID, false);
    FrameOutput torn = step(bridge, backend, {1400, 300}, ROOT_VIEWPORT_ID, true);
    report(torn);
    if (!torn.drop || !torn.drop->viewport)
        return 1;
    ViewportId detached = *torn.drop->viewport;

    // Drag the new window back onto the main window's right edge target.
    const ViewportPlacement& p = backend.placements.at(detached);
    bridge.begin_window_drag(detached, std::nullopt, p.position + Vec2{10, 10});
    FrameOutput hover = step(bridge, backend, {978, 384}, detached, false);
    if (const auto* vo = hover.viewport(ROOT_VIEWPORT_ID); vo && vo->hovered)
        std::cout << "hovering dock side " << dock_side_name(*vo->hovered) << "\n";
    report(step(bridge, backend, {978, 384}, detached, true));

    std::cout << "final: " << bridge.model().serialize() << "\n";
    return 0;
}
