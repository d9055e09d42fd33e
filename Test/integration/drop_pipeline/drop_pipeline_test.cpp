#include "channel/DropChannel.hpp"
#include "native/NativeDropHost.hpp"
#include "region/DropRegion.hpp"
#include "region/RectGeometry.hpp"

#include <catch2/catch_test_macros.hpp>

#include "common/region_recorder.hpp"
#include "common/scoped_access_mock.hpp"
#include "common/temp_workspace.hpp"

using namespace Drop;
using namespace Drop::Native;
using namespace Drop::Channel;

namespace {

// Native host and UI wired together the way the application does it, with
// the UI side created but not yet initialised.
struct Pipeline {
  Pipeline()
      : ends(MethodChannel::create_pair(std::string{channel_name})),
        host(ends.first, access, &services),
        channel(ends.second, bus, scheduler, {.hover_without_enter = false}) {}

  auto add_region(RectGeometry &geometry, RegionRecorder &recorder,
                  bool app_wide) -> Scope<DropRegion> {
    return make_scope<DropRegion>(
        bus, scheduler, geometry, recorder.callbacks(),
        RegionOptions{.catch_app_wide_drops = app_wide,
                      .scale_hover_points = false,
                      .exit_before_drop = false});
  }

  auto frames(usize count) -> void {
    for (usize i = 0; i < count; ++i)
      scheduler.run_post_frame_callbacks();
  }

  MockScopedAccess access;
  ServicePayloadQueue services;
  std::pair<Ref<MethodChannel>, Ref<MethodChannel>> ends;
  NativeDropHost host;
  DropEventBus bus;
  FrameScheduler scheduler;
  DropChannel channel;
};

} // namespace

TEST_CASE("Hovered drop from window to region", "[Integration][Pipeline]") {
  TempWorkspace workspace;
  Pipeline pipeline;
  pipeline.host.handle_did_finish_launching();
  pipeline.channel.init();

  RectGeometry left_geometry;
  RectGeometry right_geometry;
  left_geometry.set_layout(Position{0.0F, 0.0F}, Position{100.0F, 100.0F});
  right_geometry.set_layout(Position{100.0F, 0.0F}, Position{100.0F, 100.0F});
  RegionRecorder left;
  RegionRecorder right;
  auto left_region = pipeline.add_region(left_geometry, left, true);
  auto right_region = pipeline.add_region(right_geometry, right, false);

  const auto file = workspace.write_file(workspace.outside() / "a.txt");
  auto session =
      pipeline.host.create_drag_session({.height = 200.0F, .flip_y = false});

  session->dragging_entered(Position{150.0F, 20.0F});
  session->dragging_updated(Position{160.0F, 30.0F});

  DragPayload payload{};
  payload.file_urls = {file};
  REQUIRE(session->perform_drag_operation(payload));

  REQUIRE(right.kinds() ==
          std::vector<std::string>{"enter", "update", "exit", "done"});
  REQUIRE(right.calls.back().local == Position{60.0F, 30.0F});
  REQUIRE(right.calls.back().global == Position{160.0F, 30.0F});
  REQUIRE(right.last_done->at(0).get_path() == file.string());

  // The drop was hovered elsewhere, so the app-wide region stays quiet.
  REQUIRE(left.calls.empty());
  REQUIRE_FALSE(pipeline.bus.has_pending_ambient_drop());
}

TEST_CASE("Launch-time open lands once after the first layout",
          "[Integration][Pipeline]") {
  TempWorkspace workspace;
  Pipeline pipeline;

  const auto file = workspace.write_file(workspace.outside() / "opened.txt");
  REQUIRE(pipeline.host.handle_open({file}));
  REQUIRE(pipeline.services.accept({.plain_text = std::string{"serviced"}}));

  RectGeometry geometry;
  RegionRecorder recorder;
  auto region = pipeline.add_region(geometry, recorder, true);

  pipeline.host.handle_did_finish_launching();
  pipeline.channel.init();

  // The merged launch batch arrived while the region had no layout.
  REQUIRE(recorder.calls.empty());
  pipeline.frames(3);
  REQUIRE(recorder.calls.empty());

  geometry.set_layout(Position{20.0F, 10.0F}, Position{100.0F, 50.0F});
  pipeline.frames(1);

  REQUIRE(recorder.kinds() == std::vector<std::string>{"done"});
  REQUIRE(recorder.calls[0].local == Position{50.0F, 25.0F});
  REQUIRE(recorder.calls[0].global == Position{70.0F, 35.0F});
  // The opened file and the service text travel together.
  REQUIRE(recorder.last_done->size() == 2);
  REQUIRE(recorder.last_done->at(0).get_path() == file.string());
  REQUIRE(read_as_text(recorder.last_done->at(1)) ==
          std::optional<std::string>{"serviced"});

  pipeline.frames(3);
  REQUIRE(recorder.count("done") == 1);
}

TEST_CASE("A batch resolved before ready arrives exactly once",
          "[Integration][Pipeline]") {
  TempWorkspace workspace;
  Pipeline pipeline;
  pipeline.host.handle_did_finish_launching();

  RectGeometry geometry;
  geometry.set_layout(Position{0.0F, 0.0F}, Position{200.0F, 200.0F});
  RegionRecorder recorder;
  auto region = pipeline.add_region(geometry, recorder, true);

  const auto file = workspace.write_file(workspace.outside() / "early.txt");
  auto session =
      pipeline.host.create_drag_session({.height = 200.0F, .flip_y = false});
  DragPayload payload{};
  payload.file_urls = {file};
  REQUIRE(session->perform_drag_operation(payload));
  REQUIRE(pipeline.host.get_gate().queued() == 1);

  pipeline.channel.init();
  // The readiness retry after the first frame must not replay the batch.
  pipeline.frames(2);

  REQUIRE(recorder.count("done") == 1);
  REQUIRE(recorder.calls[0].local == Position{100.0F, 100.0F});
  REQUIRE(pipeline.host.get_gate().queued() == 0);
}

TEST_CASE("Regions created after the drop read the buffered batch",
          "[Integration][Pipeline]") {
  TempWorkspace workspace;
  Pipeline pipeline;
  pipeline.host.handle_did_finish_launching();
  pipeline.channel.init();

  pipeline.host.handle_open_contents({"late reader"});
  REQUIRE(pipeline.bus.has_pending_ambient_drop());

  RectGeometry geometry;
  geometry.set_layout(Position{0.0F, 0.0F}, Position{40.0F, 40.0F});
  RegionRecorder recorder;
  auto region = pipeline.add_region(geometry, recorder, true);

  REQUIRE(recorder.kinds() == std::vector<std::string>{"done"});
  REQUIRE(read_as_text(recorder.last_done->at(0)) ==
          std::optional<std::string>{"late reader"});
  REQUIRE_FALSE(pipeline.bus.has_pending_ambient_drop());
}

TEST_CASE("Scoped access round trip over the channel",
          "[Integration][Pipeline]") {
  Pipeline pipeline;
  pipeline.channel.init();

  REQUIRE(pipeline.channel.begin_scoped_access(Bytes{'x'}));
  REQUIRE(pipeline.channel.end_scoped_access(Bytes{'x'}));
  REQUIRE_FALSE(pipeline.channel.begin_scoped_access(Bytes{}));
  REQUIRE(pipeline.access.starts == 1);
  REQUIRE(pipeline.access.stops == 1);
}
