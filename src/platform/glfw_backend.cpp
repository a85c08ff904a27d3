#ifdef DOCKBRIDGE_USE_GLFW

    #include "glfw_backend.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <dockbridge/logger.hpp>
    #include <vector>

namespace dockbridge
{

static Vec2 cursor_screen(GLFWwindow* win)
{
    double cx = 0.0, cy = 0.0;
    glfwGetCursorPos(win, &cx, &cy);
    int wx = 0, wy = 0;
    glfwGetWindowPos(win, &wx, &wy);
    return {static_cast<float>(wx + cx), static_cast<float>(wy + cy)};
}

GlfwWindowBackend::GlfwWindowBackend(GLFWwindow* root_window)
{
    if (root_window)
        windows_[ROOT_VIEWPORT_ID] = root_window;
}

GlfwWindowBackend::~GlfwWindowBackend()
{
    for (auto& [id, win] : windows_)
    {
        if (id != ROOT_VIEWPORT_ID && win)
            glfwDestroyWindow(win);
    }
}

bool GlfwWindowBackend::create_window(ViewportId id, const ViewportPlacement& placement)
{
    if (windows_.count(id))
    {
        DOCKBRIDGE_LOG_WARN(log_category::PLATFORM, "create_window: viewport {} already has a window", id);
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    glfwWindowHint(GLFW_DECORATED,
                   placement.decoration == DecorationMode::OsDecorated ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    GLFWwindow* win = glfwCreateWindow(static_cast<int>(placement.size.x),
                                       static_cast<int>(placement.size.y),
                                       placement.title.c_str(),
                                       nullptr,
                                       nullptr);
    // Restore defaults for windows the host creates later.
    glfwWindowHint(GLFW_DECORATED, GLFW_TRUE);
    glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);

    if (!win)
    {
        DOCKBRIDGE_LOG_ERROR(log_category::PLATFORM, "create_window: glfwCreateWindow failed for viewport {}", id);
        return false;
    }

    glfwSetWindowPos(win, static_cast<int>(placement.position.x), static_cast<int>(placement.position.y));
    if (placement.maximized)
        glfwMaximizeWindow(win);
    glfwShowWindow(win);

    windows_[id] = win;
    DOCKBRIDGE_LOG_DEBUG(log_category::PLATFORM, "window created for viewport {}", id);
    return true;
}

void GlfwWindowBackend::set_window_placement(ViewportId id, const ViewportPlacement& placement)
{
    GLFWwindow* win = window(id);
    if (!win)
        return;

    glfwSetWindowTitle(win, placement.title.c_str());
    glfwSetWindowAttrib(win,
                        GLFW_DECORATED,
                        placement.decoration == DecorationMode::OsDecorated ? GLFW_TRUE : GLFW_FALSE);

    if (placement.maximized)
    {
        glfwMaximizeWindow(win);
        return;
    }
    if (glfwGetWindowAttrib(win, GLFW_MAXIMIZED))
        glfwRestoreWindow(win);
    glfwSetWindowPos(win, static_cast<int>(placement.position.x), static_cast<int>(placement.position.y));
    glfwSetWindowSize(win, static_cast<int>(placement.size.x), static_cast<int>(placement.size.y));
}

void GlfwWindowBackend::begin_native_drag_move(ViewportId id)
{
    GLFWwindow* win = window(id);
    if (!win)
        return;
    int wx = 0, wy = 0;
    glfwGetWindowPos(win, &wx, &wy);
    Vec2 cursor  = cursor_screen(win);
    native_move_ = NativeMove{id, cursor - Vec2{static_cast<float>(wx), static_cast<float>(wy)}};
}

void GlfwWindowBackend::update_native_moves()
{
    if (!native_move_)
        return;
    GLFWwindow* win = window(native_move_->id);
    if (!win || glfwGetMouseButton(win, GLFW_MOUSE_BUTTON_LEFT) != GLFW_PRESS)
    {
        native_move_.reset();
        return;
    }
    Vec2 pos = cursor_screen(win) - native_move_->grab;
    glfwSetWindowPos(win, static_cast<int>(pos.x), static_cast<int>(pos.y));
}

void GlfwWindowBackend::destroy_window(ViewportId id)
{
    if (id == ROOT_VIEWPORT_ID)
        return;
    auto it = windows_.find(id);
    if (it == windows_.end())
        return;
    glfwDestroyWindow(it->second);
    windows_.erase(it);
    was_down_.erase(id);
    if (native_move_ && native_move_->id == id)
        native_move_.reset();
    DOCKBRIDGE_LOG_DEBUG(log_category::PLATFORM, "window destroyed for viewport {}", id);
}

GLFWwindow* GlfwWindowBackend::window(ViewportId id) const
{
    auto it = windows_.find(id);
    return it != windows_.end() ? it->second : nullptr;
}

ViewportInput GlfwWindowBackend::sample_viewport(ViewportId id)
{
    ViewportInput in;
    in.viewport     = id;
    GLFWwindow* win = window(id);
    if (!win)
        return in;

    int wx = 0, wy = 0, ww = 0, wh = 0;
    glfwGetWindowPos(win, &wx, &wy);
    glfwGetWindowSize(win, &ww, &wh);
    in.inner_rect = Rect{static_cast<float>(wx), static_cast<float>(wy), static_cast<float>(ww), static_cast<float>(wh)};

    double cx = 0.0, cy = 0.0;
    glfwGetCursorPos(win, &cx, &cy);
    in.pointer_local = Vec2{static_cast<float>(cx), static_cast<float>(cy)};

    bool down           = glfwGetMouseButton(win, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;
    in.primary_down     = down;
    in.primary_released = was_down_[id] && !down;
    was_down_[id]       = down;

    in.modifiers.shift = glfwGetKey(win, GLFW_KEY_LEFT_SHIFT) == GLFW_PRESS
                         || glfwGetKey(win, GLFW_KEY_RIGHT_SHIFT) == GLFW_PRESS;
    in.modifiers.ctrl = glfwGetKey(win, GLFW_KEY_LEFT_CONTROL) == GLFW_PRESS
                        || glfwGetKey(win, GLFW_KEY_RIGHT_CONTROL) == GLFW_PRESS;
    in.modifiers.alt = glfwGetKey(win, GLFW_KEY_LEFT_ALT) == GLFW_PRESS
                       || glfwGetKey(win, GLFW_KEY_RIGHT_ALT) == GLFW_PRESS;
    return in;
}

// ─── GlfwHintSampler ─────────────────────────────────────────────────────────

FrameInput GlfwHintSampler::sample()
{
    FrameInput input;
    for (const auto& [id, win] : backend_->windows())
        input.viewports.push_back(backend_->sample_viewport(id));

    // The global pointer is the same from every window; take the first.
    if (!backend_->windows().empty())
        input.hints.pointer_global = cursor_screen(backend_->windows().begin()->second);

    for (const auto& [id, win] : backend_->windows())
    {
        if (glfwGetWindowAttrib(win, GLFW_HOVERED))
        {
            input.hints.hovered_viewport = id;
            break;
        }
    }

    int           count    = 0;
    GLFWmonitor** monitors = glfwGetMonitors(&count);
    if (monitors && count > 0)
    {
        std::vector<Rect> areas;
        for (int i = 0; i < count; ++i)
        {
            int x = 0, y = 0, w = 0, h = 0;
            glfwGetMonitorWorkarea(monitors[i], &x, &y, &w, &h);
            areas.push_back(Rect{static_cast<float>(x), static_cast<float>(y), static_cast<float>(w), static_cast<float>(h)});
        }
        input.hints.monitors = std::move(areas);
    }
    return input;
}

}   // namespace dockbridge

#endif   // DOCKBRIDGE_USE_GLFW
