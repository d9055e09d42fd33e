#pragma once

#include "App.hpp"
#include "Types.hpp"
#include "region/DropRegion.hpp"
#include "region/RectGeometry.hpp"

#include <string>

using namespace Drop;

/**
 * Two side by side panels. The left one also takes drops that never hovered
 * the window, so files passed on the command line land there.
 */
class DemoApp : public App {
public:
  explicit DemoApp(const ApplicationProperties &props);
  ~DemoApp() override = default;

  void on_update(floating ts) override;
  void on_resize(u32 width, u32 height) override;
  void on_create() override;
  void on_destroy() override;

private:
  struct Panel {
    std::string name;
    RectGeometry geometry{};
    Scope<DropRegion> region{};
    u32 drops{0};
  };

  auto make_callbacks(Panel &panel) -> RegionCallbacks;
  auto layout() -> void;

  Panel left{.name = "left"};
  Panel right{.name = "right"};
  bool needs_layout{true};
};
