#include "channel/DropChannel.hpp"
#include "channel/ItemCodec.hpp"

#include "Exception.hpp"

#include <catch2/catch_test_macros.hpp>

#include "common/recording_listener.hpp"

using namespace Drop;
using namespace Drop::Channel;

namespace {

struct ChannelFixture {
  explicit ChannelFixture(DropChannel::Options options = {})
      : ends(MethodChannel::create_pair("desktop_drop")),
        channel(ends.second, bus, scheduler, options) {
    bus.register_listener(listener);
    ends.first->set_method_call_handler(
        [this](const MethodCall &call) -> MethodResult {
          native_calls.push_back(call);
          return true;
        });
    channel.init();
    native_calls.clear();
  }

  auto send(Method method, Arguments arguments = {}) -> MethodResult {
    return ends.first->invoke_method(method, std::move(arguments));
  }

  DropEventBus bus;
  FrameScheduler scheduler;
  RecordingListener listener;
  std::pair<Ref<MethodChannel>, Ref<MethodChannel>> ends;
  DropChannel channel;
  std::vector<MethodCall> native_calls;
};

} // namespace

TEST_CASE("Hover messages become events", "[DropChannel]") {
  ChannelFixture fixture{{.hover_without_enter = false}};

  fixture.send(Method::Entered, Position{10.0F, 20.0F});
  fixture.send(Method::Updated, Position{11.0F, 21.0F});
  fixture.send(Method::Exited);

  const auto &records = fixture.listener.records;
  REQUIRE(records.size() == 3);
  REQUIRE(records[0].type == EventType::DropEntered);
  REQUIRE(records[1].type == EventType::DropUpdated);
  REQUIRE(records[2].type == EventType::DropExited);
  // Exit carries the last hover position.
  REQUIRE(records[2].position == Position{11.0F, 21.0F});
  REQUIRE_FALSE(fixture.channel.get_last_position().has_value());
}

TEST_CASE("Updates open a gesture without enter", "[DropChannel]") {
  ChannelFixture fixture{{.hover_without_enter = true}};

  fixture.send(Method::Updated, Position{5.0F, 5.0F});
  fixture.send(Method::Updated, Position{6.0F, 6.0F});

  REQUIRE(fixture.listener.records[0].type == EventType::DropEntered);
  REQUIRE(fixture.listener.records[1].type == EventType::DropUpdated);
}

TEST_CASE("Done placement", "[DropChannel]") {
  ChannelFixture fixture{{.hover_without_enter = false}};

  SECTION("At the last hover position") {
    fixture.send(Method::Entered, Position{30.0F, 40.0F});
    fixture.send(Method::PerformOperation,
                 std::vector<std::string>{"/tmp/a.txt", "/tmp/b.txt"});

    const auto &done = fixture.listener.records.back();
    REQUIRE(done.type == EventType::DropDone);
    REQUIRE(done.position == Position{30.0F, 40.0F});
    REQUIRE(done.items == 2);
  }

  SECTION("At the origin without hover") {
    const DropItems items{FileItem{.path = "/tmp/a.txt"},
                          make_memory_item("x", "Dropped Text.txt",
                                           "text/plain")};
    fixture.send(Method::PerformOperationNative, encode_items(items));

    const auto &done = fixture.listener.records.back();
    REQUIRE(done.position == origin);
    REQUIRE(done.items == 2);
    REQUIRE(done.shared_items->at(1).is<MemoryItem>());
  }

  SECTION("At the position of a uri-list drop") {
    fixture.send(Method::PerformOperationLinux,
                 LinuxDrop{.uri_list = "file:///tmp/a.txt\r\n# c\r\n",
                           .position = Position{7.0F, 8.0F}});

    const auto &done = fixture.listener.records.back();
    REQUIRE(done.position == Position{7.0F, 8.0F});
    REQUIRE(done.items == 1);
    REQUIRE(done.shared_items->at(0).get_path() == "/tmp/a.txt");
  }

  SECTION("One Done per gesture, position reset afterwards") {
    fixture.send(Method::Entered, Position{1.0F, 1.0F});
    fixture.send(Method::PerformOperation, std::vector<std::string>{});
    fixture.send(Method::PerformOperation, std::vector<std::string>{});

    REQUIRE(fixture.listener.count(EventType::DropDone) == 2);
    REQUIRE(fixture.listener.records.back().position == origin);
  }
}

TEST_CASE("Protocol errors reach the native caller", "[DropChannel]") {
  ChannelFixture fixture;

  REQUIRE_THROWS_AS(fixture.ends.first->invoke_method(MethodCall{"dragged"}),
                    ProtocolException);
  REQUIRE_THROWS_AS(fixture.send(Method::ReadyForGlobalDrops),
                    ProtocolException);
  REQUIRE_THROWS_AS(fixture.send(Method::Entered), ProtocolException);
  REQUIRE(fixture.listener.records.empty());
}

TEST_CASE("Readiness is signalled at init and once after a frame",
          "[DropChannel]") {
  DropEventBus bus;
  FrameScheduler scheduler;
  auto [native_end, ui_end] = MethodChannel::create_pair("desktop_drop");
  DropChannel channel{ui_end, bus, scheduler};

  usize ready_calls = 0;
  native_end->set_method_call_handler(
      [&ready_calls](const MethodCall &call) -> MethodResult {
        if (parse_method(call.method) == Method::ReadyForGlobalDrops)
          ++ready_calls;
        return true;
      });

  channel.init();
  channel.init();
  REQUIRE(ready_calls == 1);

  scheduler.run_post_frame_callbacks();
  REQUIRE(ready_calls == 2);

  scheduler.run_post_frame_callbacks();
  REQUIRE(ready_calls == 2);
}

TEST_CASE("Scoped access with empty bookmarks", "[DropChannel]") {
  ChannelFixture fixture;

  REQUIRE_FALSE(fixture.channel.begin_scoped_access(Bytes{}));
  REQUIRE(fixture.channel.end_scoped_access(Bytes{}));
  REQUIRE(fixture.native_calls.empty());

  REQUIRE(fixture.channel.begin_scoped_access(Bytes{1}));
  REQUIRE(fixture.channel.end_scoped_access(Bytes{1}));
  REQUIRE(fixture.native_calls.size() == 2);
  REQUIRE(fixture.native_calls[0].method ==
          "startAccessingSecurityScopedResource");
}
