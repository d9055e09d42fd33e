#include "dispatch/DropEventBus.hpp"

#include "Exception.hpp"

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

#include "common/recording_listener.hpp"

using namespace Drop;

namespace {

auto ambient_done(usize item_count) -> DropDoneEvent {
  DropItems items;
  for (usize i = 0; i < item_count; ++i)
    items.emplace_back(FileItem{.path = fmt::format("/tmp/{}.txt", i)});
  return DropDoneEvent{origin, std::move(items)};
}

class ThrowingListener : public IDropEventListener {
public:
  auto on_drop_event(const DropEvent &) -> void override {
    throw std::runtime_error("listener failure");
  }
};

} // namespace

TEST_CASE("Publish reaches listeners in registration order", "[EventBus]") {
  DropEventBus bus;
  std::vector<int> order;
  RecordingListener first;
  RecordingListener second;
  first.hook = [&order](const DropEvent &) { order.push_back(1); };
  second.hook = [&order](const DropEvent &) { order.push_back(2); };
  bus.register_listener(first);
  bus.register_listener(second);

  bus.publish(DropEnterEvent{Position{1.0F, 2.0F}});

  REQUIRE(order == std::vector<int>{1, 2});
  REQUIRE(first.records[0].type == EventType::DropEntered);
}

TEST_CASE("A throwing listener does not stop delivery", "[EventBus]") {
  DropEventBus bus;
  ThrowingListener throwing;
  RecordingListener recording;
  bus.register_listener(throwing);
  bus.register_listener(recording);

  REQUIRE_NOTHROW(bus.publish(DropExitEvent{origin}));
  REQUIRE(recording.records.size() == 1);
}

TEST_CASE("Registration misuse", "[EventBus]") {
  DropEventBus bus;
  RecordingListener listener;
  bus.register_listener(listener);

  REQUIRE_THROWS_AS(bus.register_listener(listener), StateMisuseException);

  bus.unregister_listener(listener);
  REQUIRE_THROWS_AS(bus.unregister_listener(listener), StateMisuseException);
  REQUIRE(bus.listener_count() == 0);
}

TEST_CASE("Listener changes during publish", "[EventBus]") {
  DropEventBus bus;
  RecordingListener first;
  RecordingListener second;
  RecordingListener late;

  SECTION("Removed listeners are skipped") {
    first.hook = [&](const DropEvent &) { bus.unregister_listener(second); };
    bus.register_listener(first);
    bus.register_listener(second);

    bus.publish(DropEnterEvent{origin});

    REQUIRE(first.records.size() == 1);
    REQUIRE(second.records.empty());
  }

  SECTION("Added listeners see the next event only") {
    first.hook = [&](const DropEvent &) {
      if (!bus.contains(late))
        bus.register_listener(late);
    };
    bus.register_listener(first);

    bus.publish(DropEnterEvent{origin});
    REQUIRE(late.records.empty());

    bus.publish(DropUpdateEvent{origin});
    REQUIRE(late.records.size() == 1);
    REQUIRE(late.records[0].type == EventType::DropUpdated);
  }
}

TEST_CASE("Ambient drops are buffered last-write-wins", "[EventBus]") {
  DropEventBus bus;

  bus.publish(ambient_done(1));
  bus.publish(ambient_done(2));
  REQUIRE(bus.has_pending_ambient_drop());

  RecordingListener first;
  bus.register_listener(first);
  REQUIRE(first.records.size() == 1);
  REQUIRE(first.records[0].items == 2);
  REQUIRE_FALSE(bus.has_pending_ambient_drop());

  RecordingListener second;
  bus.register_listener(second);
  REQUIRE(second.records.empty());
}

TEST_CASE("Ambient drops are buffered even with listeners", "[EventBus]") {
  DropEventBus bus;
  RecordingListener present;
  bus.register_listener(present);

  bus.publish(ambient_done(1));
  REQUIRE(present.records.size() == 1);
  REQUIRE(bus.has_pending_ambient_drop());

  RecordingListener late;
  bus.register_listener(late);
  REQUIRE(late.records.size() == 1);
  REQUIRE(present.records.size() == 1);
}

TEST_CASE("Hovered drops are not buffered", "[EventBus]") {
  DropEventBus bus;
  bus.publish(DropDoneEvent{Position{10.0F, 10.0F}, DropItems{}});
  bus.publish(DropEnterEvent{origin});

  REQUIRE_FALSE(bus.has_pending_ambient_drop());
}
