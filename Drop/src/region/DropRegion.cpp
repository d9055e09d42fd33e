#include "pch/desktop_drop_pch.hpp"

#include "region/DropRegion.hpp"

#include "Logger.hpp"

namespace Drop {

DropRegion::DropRegion(DropEventBus &event_bus,
                       FrameScheduler &frame_scheduler,
                       IRegionGeometry &region_geometry,
                       RegionCallbacks region_callbacks,
                       RegionOptions region_options)
    : FiniteStateMachine(RegionStatus::Idle), bus(&event_bus),
      scheduler(&frame_scheduler), geometry(&region_geometry),
      callbacks(std::move(region_callbacks)), options(region_options) {
  if (options.enabled)
    bus->register_listener(*this);
}

DropRegion::~DropRegion() {
  *alive = false;
  if (bus->contains(*this))
    bus->unregister_listener(*this);
}

auto DropRegion::set_enabled(bool enable) -> void {
  if (enable == options.enabled)
    return;
  options.enabled = enable;

  if (enable) {
    bus->register_listener(*this);
    return;
  }

  bus->unregister_listener(*this);
  if (!is(RegionStatus::Idle))
    move_to(RegionStatus::Idle, origin, origin);
}

auto DropRegion::on_drop_event(const DropEvent &event) -> void {
  const auto bounds = geometry->get_bounds();
  if (!bounds) {
    EventDispatcher dispatcher{event};
    dispatcher.dispatch<DropDoneEvent>([this](const DropDoneEvent &done) {
      if (options.catch_app_wide_drops && done.is_ambient())
        queue_ambient_drop(done);
    });
    return;
  }

  const auto global = to_surface(event.get_position());
  const auto local = geometry->global_to_local(global);
  const bool inside = bounds->contains(local);

  EventDispatcher dispatcher{event};
  dispatcher.dispatch<DropEnterEvent>(
      [&](const DropEnterEvent &) { handle_enter(local, global, inside); });
  dispatcher.dispatch<DropUpdateEvent>(
      [&](const DropUpdateEvent &) { handle_update(local, global, inside); });
  dispatcher.dispatch<DropExitEvent>(
      [&](const DropExitEvent &) { handle_exit(local, global); });
  dispatcher.dispatch<DropDoneEvent>([&](const DropDoneEvent &done) {
    handle_done(done, *bounds, local, global, inside);
  });
}

auto DropRegion::handle_enter(const Position &local, const Position &global,
                              bool inside) -> void {
  if (inside && is(RegionStatus::Idle))
    move_to(RegionStatus::Entered, local, global);
}

auto DropRegion::handle_update(const Position &local, const Position &global,
                               bool inside) -> void {
  if (is(RegionStatus::Idle)) {
    if (inside)
      move_to(RegionStatus::Entered, local, global);
    return;
  }

  if (inside)
    move_to(RegionStatus::Updating, local, global);
  else
    move_to(RegionStatus::Idle, local, global);
}

auto DropRegion::handle_exit(const Position &local, const Position &global)
    -> void {
  if (!is(RegionStatus::Idle))
    move_to(RegionStatus::Idle, local, global);
}

auto DropRegion::handle_done(const DropDoneEvent &event, const Rect &bounds,
                             const Position &local, const Position &global,
                             bool inside) -> void {
  const bool ambient = event.is_ambient();
  const bool hovered =
      (!is(RegionStatus::Idle) || (options.exit_before_drop && !ambient)) &&
      inside;
  if (!hovered && !(options.catch_app_wide_drops && ambient))
    return;

  if (hovered) {
    deliver_done(event.share_items(), local, global);
    return;
  }

  // No real hover position exists for an ambient drop.
  const auto center = bounds.center();
  deliver_done(event.share_items(), center,
               geometry->local_to_global(center));
}

auto DropRegion::queue_ambient_drop(const DropDoneEvent &event) -> void {
  if (queued_drop)
    debug("Replacing queued ambient drop of {} item(s)",
          queued_drop->get_items().size());
  queued_drop.emplace(event.get_position(), event.share_items());
  schedule_retry();
}

auto DropRegion::schedule_retry() -> void {
  if (retry_scheduled)
    return;
  retry_scheduled = true;
  scheduler->add_post_frame_callback([this, token = Weak<bool>{alive}] {
    if (auto still_alive = token.lock(); still_alive && *still_alive) {
      retry_scheduled = false;
      try_deliver_queued_drop();
    }
  });
}

auto DropRegion::try_deliver_queued_drop() -> void {
  if (!queued_drop)
    return;
  if (!options.enabled) {
    debug("Discarding queued ambient drop of disabled region");
    queued_drop.reset();
    return;
  }

  const auto bounds = geometry->get_bounds();
  if (!bounds) {
    schedule_retry();
    return;
  }

  auto items = queued_drop->share_items();
  queued_drop.reset();
  const auto center = bounds->center();
  deliver_done(std::move(items), center, geometry->local_to_global(center));
}

auto DropRegion::deliver_done(Ref<const DropItems> items,
                              const Position &local, const Position &global)
    -> void {
  if (!is(RegionStatus::Idle))
    move_to(RegionStatus::Idle, local, global);

  if (callbacks.on_done)
    callbacks.on_done(DropDoneDetails{
        .items = std::move(items), .local = local, .global = global});
}

auto DropRegion::move_to(RegionStatus state, const Position &local,
                         const Position &global) -> void {
  transition_details = DropEventDetails{.local = local, .global = global};
  transition_to(state);
}

auto DropRegion::on_enter_state(RegionStatus state) -> void {
  FiniteStateMachine::on_enter_state(state);

  const auto &callback = [&]() -> const auto & {
    switch (state) {
    case RegionStatus::Entered:
      return callbacks.on_entered;
    case RegionStatus::Updating:
      return callbacks.on_updated;
    case RegionStatus::Idle:
      break;
    }
    return callbacks.on_exited;
  }();

  if (callback)
    callback(transition_details);
}

auto DropRegion::to_surface(const Position &position) const -> Position {
  if (!options.scale_hover_points)
    return position;
  const auto ratio = geometry->get_device_pixel_ratio();
  if (ratio <= 0.0F)
    return position;
  return position / static_cast<float>(ratio);
}

} // namespace Drop
