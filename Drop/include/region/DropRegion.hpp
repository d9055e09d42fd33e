#pragma once

#include "Config.hpp"
#include "Event.hpp"
#include "FiniteStateMachine.hpp"
#include "FrameScheduler.hpp"
#include "Geometry.hpp"
#include "Types.hpp"
#include "dispatch/DropEventBus.hpp"

#include <functional>
#include <optional>

namespace Drop {

enum class RegionStatus : u8 {
  Idle,
  Entered,
  Updating,
};

struct DropEventDetails {
  Position local{origin};
  Position global{origin};
};

struct DropDoneDetails {
  Ref<const DropItems> items;
  Position local{origin};
  Position global{origin};

  [[nodiscard]] auto get_items() const -> const DropItems & { return *items; }
};

struct RegionCallbacks {
  std::function<void(const DropEventDetails &)> on_entered{};
  std::function<void(const DropEventDetails &)> on_updated{};
  std::function<void(const DropEventDetails &)> on_exited{};
  std::function<void(const DropDoneDetails &)> on_done{};
};

struct RegionOptions {
  bool enabled{true};
  // Also take drops that never hovered the window, e.g. on the app icon.
  bool catch_app_wide_drops{false};
  // Divide incoming positions by the device pixel ratio.
  bool scale_hover_points{Config::scale_hover_points};
  // Positioned drops inside the bounds count as hovered while idle.
  bool exit_before_drop{Config::exit_before_drop};
};

/**
 * @brief One on-screen drop target. Hit-tests every published event against
 * its current bounds and turns the stream into enter/update/exit/done
 * callbacks with region-local positions.
 *
 * Registers itself with the bus while enabled and unregisters on destruction.
 * UI thread only.
 */
class DropRegion : public IDropEventListener,
                   private FiniteStateMachine<RegionStatus> {
public:
  DropRegion(DropEventBus &event_bus, FrameScheduler &frame_scheduler,
             IRegionGeometry &region_geometry, RegionCallbacks region_callbacks,
             RegionOptions region_options = {});
  ~DropRegion() override;

  DropRegion(const DropRegion &) = delete;
  DropRegion &operator=(const DropRegion &) = delete;

  auto on_drop_event(const DropEvent &event) -> void override;

  // Disabling mid-gesture reports an exit before leaving the bus.
  auto set_enabled(bool enable) -> void;
  auto set_catch_app_wide_drops(bool catch_drops) -> void {
    options.catch_app_wide_drops = catch_drops;
  }
  auto set_callbacks(RegionCallbacks region_callbacks) -> void {
    callbacks = std::move(region_callbacks);
  }

  [[nodiscard]] auto get_status() const -> RegionStatus {
    return get_current_state();
  }
  [[nodiscard]] auto is_enabled() const -> bool { return options.enabled; }
  [[nodiscard]] auto catches_app_wide_drops() const -> bool {
    return options.catch_app_wide_drops;
  }
  [[nodiscard]] auto has_queued_drop() const -> bool {
    return queued_drop.has_value();
  }

protected:
  auto on_enter_state(RegionStatus state) -> void override;

private:
  auto handle_enter(const Position &local, const Position &global,
                    bool inside) -> void;
  auto handle_update(const Position &local, const Position &global,
                     bool inside) -> void;
  auto handle_exit(const Position &local, const Position &global) -> void;
  auto handle_done(const DropDoneEvent &event, const Rect &bounds,
                   const Position &local, const Position &global,
                   bool inside) -> void;

  auto queue_ambient_drop(const DropDoneEvent &event) -> void;
  auto schedule_retry() -> void;
  auto try_deliver_queued_drop() -> void;
  auto deliver_done(Ref<const DropItems> items, const Position &local,
                    const Position &global) -> void;
  auto move_to(RegionStatus state, const Position &local,
               const Position &global) -> void;
  [[nodiscard]] auto to_surface(const Position &position) const -> Position;

  DropEventBus *bus{nullptr};
  FrameScheduler *scheduler{nullptr};
  IRegionGeometry *geometry{nullptr};
  RegionCallbacks callbacks;
  RegionOptions options;

  DropEventDetails transition_details{};
  std::optional<DropDoneEvent> queued_drop{};
  bool retry_scheduled{false};
  Ref<bool> alive{make_ref<bool>(true)};
};

} // namespace Drop
