#pragma once

#ifdef DOCKBRIDGE_USE_GLFW

    #include <dockbridge/fwd.hpp>
    #include <map>
    #include <optional>

    #include "bridge/frame_input.hpp"
    #include "bridge/window_backend.hpp"

struct GLFWwindow;

namespace dockbridge
{

// ─── GlfwWindowBackend ───────────────────────────────────────────────────────
// One GLFW window per detached viewport.  The root window is owned by the
// host and only registered for sampling.
//
// GLFW has no OS drag-move request; an OS-decorated window handed to
// begin_native_drag_move() follows the cursor from update_native_moves()
// until the primary button is released.

class GlfwWindowBackend : public WindowBackend
{
   public:
    explicit GlfwWindowBackend(GLFWwindow* root_window);
    ~GlfwWindowBackend() override;

    GlfwWindowBackend(const GlfwWindowBackend&)            = delete;
    GlfwWindowBackend& operator=(const GlfwWindowBackend&) = delete;

    bool create_window(ViewportId id, const ViewportPlacement& placement) override;
    void set_window_placement(ViewportId id, const ViewportPlacement& placement) override;
    void begin_native_drag_move(ViewportId id) override;
    void destroy_window(ViewportId id) override;

    // Call once per frame after glfwPollEvents().
    void update_native_moves();

    GLFWwindow*                              window(ViewportId id) const;
    const std::map<ViewportId, GLFWwindow*>& windows() const { return windows_; }

    // What one window observed since the previous call (release edges are
    // detected against the previous sample).
    ViewportInput sample_viewport(ViewportId id);

   private:
    struct NativeMove
    {
        ViewportId id = 0;
        Vec2       grab{};   // cursor minus window position, screen units
    };

    std::map<ViewportId, GLFWwindow*> windows_;
    std::map<ViewportId, bool>        was_down_;
    std::optional<NativeMove>         native_move_;
};

// ─── GlfwHintSampler ─────────────────────────────────────────────────────────
// Builds a FrameInput for every window of a backend, with hovered-viewport,
// global pointer and monitor work-area hints.

class GlfwHintSampler
{
   public:
    explicit GlfwHintSampler(GlfwWindowBackend& backend) : backend_(&backend) {}

    FrameInput sample();

   private:
    GlfwWindowBackend* backend_;
};

}   // namespace dockbridge

#endif   // DOCKBRIDGE_USE_GLFW
