#pragma once

#include "Types.hpp"

#include <glm/glm.hpp>
#include <optional>

namespace Drop {

using Position = glm::vec2;

// Done events without a hover coordinate carry this position.
inline constexpr Position origin{0.0F, 0.0F};

[[nodiscard]] constexpr auto is_origin(const Position &position) -> bool {
  return position.x == origin.x && position.y == origin.y;
}

/**
 * Axis aligned rectangle in region-local space. Like paint bounds, min is
 * inclusive and max exclusive.
 */
class Rect {
public:
  constexpr Rect() = default;
  constexpr Rect(const Position &min_corner, const Position &max_corner) noexcept
      : min(min_corner), max(max_corner) {}

  static constexpr auto from_size(const Position &size) noexcept -> Rect {
    return Rect{Position{0.0F}, size};
  }

  [[nodiscard]] constexpr auto contains(const Position &point) const -> bool {
    return point.x >= min.x && point.y >= min.y && point.x < max.x &&
           point.y < max.y;
  }

  [[nodiscard]] constexpr auto center() const -> Position {
    return (min + max) * 0.5F;
  }

  [[nodiscard]] constexpr auto size() const -> Position { return max - min; }
  [[nodiscard]] constexpr auto get_min() const -> const Position & {
    return min;
  }
  [[nodiscard]] constexpr auto get_max() const -> const Position & {
    return max;
  }

  [[nodiscard]] constexpr auto empty() const -> bool {
    return max.x <= min.x || max.y <= min.y;
  }

private:
  Position min{0.0F};
  Position max{0.0F};
};

/**
 * @brief What the layout system exposes about one region. Bounds are
 * std::nullopt until the first layout pass has produced geometry.
 */
class IRegionGeometry {
public:
  virtual ~IRegionGeometry() = default;

  [[nodiscard]] virtual auto get_bounds() const -> std::optional<Rect> = 0;
  [[nodiscard]] virtual auto global_to_local(const Position &) const
      -> Position = 0;
  [[nodiscard]] virtual auto local_to_global(const Position &) const
      -> Position = 0;
  [[nodiscard]] virtual auto get_device_pixel_ratio() const -> floating {
    return 1.0F;
  }
};

} // namespace Drop
