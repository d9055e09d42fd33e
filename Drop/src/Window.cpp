#include "pch/desktop_drop_pch.hpp"

#include "Window.hpp"

#include "Logger.hpp"
#include "native/DragSession.hpp"

#include <GLFW/glfw3.h>
#include <stdexcept>

namespace Drop {

Window::Window(const WindowProperties &props) : properties(props) {
  if (properties.headless)
    return;

  if (!glfwInit()) {
    error("Failed to initialize GLFW");
    throw std::runtime_error("Failed to initialize GLFW");
  }

  glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
  window = glfwCreateWindow(static_cast<i32>(properties.width),
                            static_cast<i32>(properties.height),
                            properties.title.c_str(), nullptr, nullptr);
  if (window == nullptr) {
    glfwTerminate();
    error("Failed to create window '{}'", properties.title);
    throw std::runtime_error("Failed to create window");
  }

  glfwSetWindowUserPointer(window, this);
  glfwSetWindowSizeCallback(
      window, +[](GLFWwindow *win, i32 w, i32 h) {
        auto &self = *static_cast<Window *>(glfwGetWindowUserPointer(win));
        self.properties.width = static_cast<u32>(w);
        self.properties.height = static_cast<u32>(h);
        self.user_data.was_resized = true;
        if (self.user_data.resize_callback)
          self.user_data.resize_callback(self.properties.width,
                                         self.properties.height);
      });

  glfwSetDropCallback(
      window, +[](GLFWwindow *win, i32 count, const char **paths) {
        auto &self = *static_cast<Window *>(glfwGetWindowUserPointer(win));
        auto *session = self.user_data.drag_session;
        if (session == nullptr) {
          debug("Ignoring drop of {} path(s), no drag session attached",
                count);
          return;
        }

        f64 cursor_x{};
        f64 cursor_y{};
        glfwGetCursorPos(win, &cursor_x, &cursor_y);
        const Position cursor{static_cast<float>(cursor_x),
                              static_cast<float>(cursor_y)};

        Native::DragPayload payload{};
        for (i32 i = 0; i < count; ++i) {
          payload.file_urls.emplace_back(paths[i]);
        }

        try {
          session->dragging_entered(cursor);
          session->perform_drag_operation(payload);
        } catch (const std::exception &exc) {
          error("Drop on window failed: {}", exc.what());
        }
      });

  glfwSetCursorEnterCallback(
      window, +[](GLFWwindow *win, i32 entered) {
        auto &self = *static_cast<Window *>(glfwGetWindowUserPointer(win));
        auto *session = self.user_data.drag_session;
        if (entered == GLFW_FALSE && session != nullptr &&
            session->is_hovering())
          session->dragging_exited();
      });
}

Window::~Window() {
  if (window == nullptr)
    return;
  glfwDestroyWindow(window);
  glfwTerminate();
}

auto Window::construct(const WindowProperties &props) -> Scope<Window> {
  return Scope<Window>{new Window{props}};
}

auto Window::update() -> void {
  if (window != nullptr)
    glfwPollEvents();
}

auto Window::wait_for_events(f64 timeout_seconds) -> void {
  if (window != nullptr)
    glfwWaitEventsTimeout(timeout_seconds);
}

auto Window::get_native() const -> const GLFWwindow * { return window; }
auto Window::get_native() -> GLFWwindow * { return window; }

auto Window::should_close() const -> bool {
  if (window == nullptr)
    return false;
  return glfwWindowShouldClose(window) != GLFW_FALSE;
}

auto Window::close() -> void {
  if (window != nullptr)
    glfwSetWindowShouldClose(window, GLFW_TRUE);
}

auto Window::get_size() const -> Position {
  return Position{static_cast<float>(properties.width),
                  static_cast<float>(properties.height)};
}

auto Window::get_hover_pixel_ratio() const -> floating { return 1.0F; }

auto Window::attach_drag_session(Native::DragSession &session) -> void {
  user_data.drag_session = &session;
}

auto Window::set_resize_handler(std::function<void(u32, u32)> &&handler)
    -> void {
  user_data.resize_callback = std::move(handler);
}

} // namespace Drop
