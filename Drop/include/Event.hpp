#pragma once

#include "Concepts.hpp"
#include "DropItem.hpp"
#include "Geometry.hpp"
#include "Types.hpp"

#include <fmt/core.h>
#include <functional>
#include <string>
#include <string_view>

namespace Drop {

enum class EventType {
  None = 0,
  DropEntered,
  DropUpdated,
  DropExited,
  DropDone,
};

#define BIT(x) (1 << x)

enum EventCategory {
  EventCategoryNone = 0,
  EventCategoryHover = BIT(0),
  EventCategoryDrop = BIT(1),
};

#undef BIT

/**
 * @brief Base of the four drop events. Every event carries a position in the
 * native surface's coordinate space.
 */
class DropEvent {
public:
  explicit DropEvent(const Position &location) : position(location) {}
  virtual ~DropEvent() = default;

  [[nodiscard]] virtual auto get_event_type() const -> EventType = 0;
  [[nodiscard]] virtual auto get_name() const -> std::string_view = 0;
  [[nodiscard]] virtual auto get_category_flags() const -> i32 = 0;
  [[nodiscard]] virtual auto to_string() const -> std::string {
    return fmt::format("{}: ({}, {})", get_name(), position.x, position.y);
  }

  [[nodiscard]] bool is_in_category(EventCategory category) const {
    return get_category_flags() & category;
  }

  [[nodiscard]] auto get_position() const -> const Position & {
    return position;
  }

private:
  Position position;
};

class DropEnterEvent final : public DropEvent {
public:
  using DropEvent::DropEvent;
  ~DropEnterEvent() override = default;

  [[nodiscard]] auto get_event_type() const -> EventType override {
    return EventType::DropEntered;
  }
  [[nodiscard]] auto get_name() const -> std::string_view override {
    return "DropEnterEvent";
  }
  [[nodiscard]] auto get_category_flags() const -> i32 override {
    return EventCategoryHover;
  }

  static auto get_static_type() -> EventType { return EventType::DropEntered; }
};

class DropUpdateEvent final : public DropEvent {
public:
  using DropEvent::DropEvent;
  ~DropUpdateEvent() override = default;

  [[nodiscard]] auto get_event_type() const -> EventType override {
    return EventType::DropUpdated;
  }
  [[nodiscard]] auto get_name() const -> std::string_view override {
    return "DropUpdateEvent";
  }
  [[nodiscard]] auto get_category_flags() const -> i32 override {
    return EventCategoryHover;
  }

  static auto get_static_type() -> EventType { return EventType::DropUpdated; }
};

class DropExitEvent final : public DropEvent {
public:
  using DropEvent::DropEvent;
  ~DropExitEvent() override = default;

  [[nodiscard]] auto get_event_type() const -> EventType override {
    return EventType::DropExited;
  }
  [[nodiscard]] auto get_name() const -> std::string_view override {
    return "DropExitEvent";
  }
  [[nodiscard]] auto get_category_flags() const -> i32 override {
    return EventCategoryHover;
  }

  static auto get_static_type() -> EventType { return EventType::DropExited; }
};

class DropDoneEvent final : public DropEvent {
public:
  DropDoneEvent(const Position &location, Ref<const DropItems> dropped)
      : DropEvent(location), items(std::move(dropped)) {}
  DropDoneEvent(const Position &location, DropItems dropped)
      : DropEvent(location),
        items(make_ref<const DropItems>(std::move(dropped))) {}
  ~DropDoneEvent() override = default;

  [[nodiscard]] auto get_event_type() const -> EventType override {
    return EventType::DropDone;
  }
  [[nodiscard]] auto get_name() const -> std::string_view override {
    return "DropDoneEvent";
  }
  [[nodiscard]] auto get_category_flags() const -> i32 override {
    return EventCategoryDrop;
  }
  [[nodiscard]] auto to_string() const -> std::string override {
    return fmt::format("DropDoneEvent: ({}, {}) with {} item(s)",
                       get_position().x, get_position().y, items->size());
  }

  // Dropped without hovering, e.g. on the application icon.
  [[nodiscard]] auto is_ambient() const -> bool {
    return is_origin(get_position());
  }

  [[nodiscard]] auto get_items() const -> const DropItems & { return *items; }
  [[nodiscard]] auto share_items() const -> const Ref<const DropItems> & {
    return items;
  }

  static auto get_static_type() -> EventType { return EventType::DropDone; }

private:
  Ref<const DropItems> items;
};

template <class T>
concept IsEvent = requires {
  { T::get_static_type() } -> std::same_as<EventType>;
};

class EventDispatcher {
  template <typename T> using EventFn = std::function<void(const T &)>;

public:
  explicit EventDispatcher(const DropEvent &event) : current_event(event) {}

  template <IsEvent T> bool dispatch(EventFn<T> func) {
    if (current_event.get_event_type() == T::get_static_type()) {
      func(*static_cast<const T *>(&current_event));
      return true;
    }
    return false;
  }

private:
  const DropEvent &current_event;
};

} // namespace Drop
