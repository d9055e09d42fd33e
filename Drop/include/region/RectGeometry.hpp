#pragma once

#include "Geometry.hpp"

#include <optional>

namespace Drop {

/**
 * @brief Axis aligned panel placed at an offset in surface space. Has no
 * bounds until the first call to set_layout.
 */
class RectGeometry : public IRegionGeometry {
public:
  auto set_layout(const Position &surface_offset, const Position &size)
      -> void {
    offset = surface_offset;
    bounds = Rect::from_size(size);
  }
  auto clear_layout() -> void { bounds.reset(); }
  auto set_device_pixel_ratio(floating ratio) -> void { pixel_ratio = ratio; }

  [[nodiscard]] auto get_bounds() const -> std::optional<Rect> override {
    return bounds;
  }
  [[nodiscard]] auto global_to_local(const Position &position) const
      -> Position override {
    return position - offset;
  }
  [[nodiscard]] auto local_to_global(const Position &position) const
      -> Position override {
    return position + offset;
  }
  [[nodiscard]] auto get_device_pixel_ratio() const -> floating override {
    return pixel_ratio;
  }

private:
  std::optional<Rect> bounds{};
  Position offset{0.0F};
  floating pixel_ratio{1.0F};
};

} // namespace Drop
