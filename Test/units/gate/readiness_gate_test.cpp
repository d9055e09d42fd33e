#include "native/ReadinessGate.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace Drop;
using namespace Drop::Native;

namespace {

auto batch_of(std::string_view name) -> DropItems {
  return DropItems{FileItem{.path = FS::Path{"/tmp"} / name}};
}

} // namespace

TEST_CASE("Batches wait for both signals", "[ReadinessGate]") {
  std::vector<DropItems> delivered;
  ReadinessGate gate{
      [&delivered](DropItems &&batch) { delivered.push_back(batch); }};

  gate.submit(batch_of("a"));
  REQUIRE(delivered.empty());
  REQUIRE(gate.queued() == 1);

  SECTION("Launch first, then ready") {
    gate.mark_host_launched();
    REQUIRE(delivered.empty());

    gate.mark_ui_ready();
    REQUIRE(delivered.size() == 1);
    REQUIRE(gate.queued() == 0);
  }

  SECTION("Ready first, then launch") {
    gate.mark_ui_ready();
    REQUIRE(delivered.empty());

    gate.mark_host_launched();
    REQUIRE(delivered.size() == 1);
  }
}

TEST_CASE("Queued batches keep their order and arrive once",
          "[ReadinessGate]") {
  std::vector<DropItems> delivered;
  ReadinessGate gate{
      [&delivered](DropItems &&batch) { delivered.push_back(batch); }};

  gate.submit(batch_of("first"));
  gate.submit(batch_of("second"));
  gate.mark_host_launched();
  gate.mark_ui_ready();
  gate.mark_ui_ready();
  gate.mark_host_launched();

  REQUIRE(delivered.size() == 2);
  REQUIRE(delivered[0][0].get_name() == "first");
  REQUIRE(delivered[1][0].get_name() == "second");
}

TEST_CASE("An open gate forwards immediately", "[ReadinessGate]") {
  usize calls = 0;
  ReadinessGate gate{[&calls](DropItems &&) { ++calls; }};
  gate.mark_host_launched();
  gate.mark_ui_ready();
  REQUIRE(gate.is_open());

  gate.submit(batch_of("a"));
  gate.submit(DropItems{});

  REQUIRE(calls == 2);
  REQUIRE(gate.queued() == 0);
}
