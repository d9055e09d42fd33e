#pragma once

#include "Geometry.hpp"
#include "Types.hpp"

#include <functional>
#include <string>

extern "C" {
struct GLFWwindow;
}

namespace Drop {

namespace Native {
class DragSession;
}

struct WindowProperties {
  u32 width{1280};
  u32 height{720};
  std::string title{"DesktopDrop"};
  const bool headless{false};
};

/**
 * @brief GLFW window acting as the native drop surface. File drops are fed to
 * the attached drag session as an enter at the cursor followed by a perform;
 * the cursor leaving the window mid-gesture becomes an exit.
 */
class Window {
public:
  virtual ~Window();

  auto update() -> void;
  auto wait_for_events(f64 timeout_seconds) -> void;

  [[nodiscard]] auto get_native() const -> const GLFWwindow *;
  [[nodiscard]] auto get_native() -> GLFWwindow *;
  [[nodiscard]] auto should_close() const -> bool;
  [[nodiscard]] auto is_headless() const -> bool {
    return properties.headless;
  }

  [[nodiscard]] auto was_resized() const -> bool {
    return user_data.was_resized;
  }
  auto reset_resize_status() -> void { user_data.was_resized = false; }

  [[nodiscard]] auto get_size() const -> Position;
  // Ratio between drop positions and window size. GLFW reports the cursor
  // and the window size in the same screen coordinates on every monitor.
  [[nodiscard]] auto get_hover_pixel_ratio() const -> floating;
  [[nodiscard]] auto get_properties() const -> const WindowProperties & {
    return properties;
  }

  static auto construct(const WindowProperties &) -> Scope<Window>;

  auto attach_drag_session(Native::DragSession &session) -> void;
  auto set_resize_handler(std::function<void(u32, u32)> &&handler) -> void;
  auto close() -> void;

protected:
  explicit Window(const WindowProperties &);

private:
  WindowProperties properties;
  GLFWwindow *window{nullptr};

  struct UserPointer {
    bool was_resized{false};
    Native::DragSession *drag_session{nullptr};
    std::function<void(u32, u32)> resize_callback{};
  };
  UserPointer user_data{};
};

} // namespace Drop
