#pragma once

#include <dockbridge/fwd.hpp>
#include <dockbridge/options.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "dock_model.hpp"
#include "window_backend.hpp"

namespace dockbridge
{

struct LifecycleEvent
{
    enum class Kind
    {
        DetachedCreated,
        DetachedDestroyed,
        FloatingCreated,
        FloatingDestroyed,
        GhostSpawned,
        GhostUpgraded,
        GhostFinalized,
    };

    Kind                      kind     = Kind::DetachedCreated;
    ViewportId                viewport = ROOT_VIEWPORT_ID;
    std::optional<FloatingId> floating;
    std::string               detail;
};

const char* lifecycle_event_name(LifecycleEvent::Kind kind);

// ─── LifecycleManager ────────────────────────────────────────────────────────
// Creates and destroys detached viewports and floating windows as an effect
// of tear-off and drops, and forwards window commands to the WindowBackend.
//
// Windows are created only once their content exists in the model; a backend
// refusing a window rolls the content back.  Emptied windows are reaped in
// the frame that emptied them.

class LifecycleManager
{
   public:
    using TitleProvider = std::function<std::string(PaneId)>;

    LifecycleManager(const DockingOptions& options, DockModel& model);
    ~LifecycleManager() = default;

    LifecycleManager(const LifecycleManager&)            = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    void           set_backend(WindowBackend* backend) { backend_ = backend; }
    WindowBackend* backend() const { return backend_; }
    void           set_title_provider(TitleProvider provider) { title_provider_ = std::move(provider); }

    // ── Tear-off ────────────────────────────────────────────────────────

    // Move a host's content into a new detached viewport placed at the
    // pointer, sized after the source tile's last layout when known.
    std::optional<ViewportId> tear_off_to_viewport(const WindowHost&                       source,
                                                   const Vec2&                             pointer_global,
                                                   const std::optional<std::vector<Rect>>& monitors);

    // Move a host's content into a new floating window of `viewport`.
    std::optional<FloatingId> tear_off_to_floating(const WindowHost& source,
                                                   ViewportId        viewport,
                                                   const Vec2&       pointer_local);

    // Turn a floating window into a detached viewport.
    std::optional<ViewportId> promote_floating(ViewportId                              viewport,
                                               FloatingId                              floating,
                                               const Vec2&                             pointer_global,
                                               const std::optional<std::vector<Rect>>& monitors);

    ViewportPlacement placement_for_tear_off(std::optional<Vec2>                     content_size,
                                             const Vec2&                             pointer_global,
                                             const std::optional<std::vector<Rect>>& monitors) const;

    // Re-create windows for every detached viewport of the model (after a
    // layout restore).
    void create_windows_for_model();

    // ── Window commands ─────────────────────────────────────────────────

    void move_viewport(ViewportId viewport, const Vec2& position);
    void begin_native_move(ViewportId viewport);
    void destroy_viewport(ViewportId viewport, const std::string& reason);

    // ── Reconcile ───────────────────────────────────────────────────────

    // Destroy emptied floating windows and detached viewports.
    void reap();

    // Detached windows are titled after their first pane.
    void refresh_titles();
    std::string title_for(const DockTree& tree) const;

    std::vector<LifecycleEvent> take_events();
    void                        push_event(LifecycleEvent event);

   private:
    const DockingOptions*       options_;
    DockModel*                  model_;
    WindowBackend*              backend_ = nullptr;
    TitleProvider               title_provider_;
    std::vector<LifecycleEvent> events_;

    std::optional<Vec2> content_size_of(const WindowHost& source) const;
};

}   // namespace dockbridge
