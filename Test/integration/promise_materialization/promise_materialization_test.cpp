#include "native/NativeDropHost.hpp"

#include "ThreadPool.hpp"
#include "channel/ItemCodec.hpp"

#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

#include "common/promise_mock.hpp"
#include "common/scoped_access_mock.hpp"
#include "common/temp_workspace.hpp"

using namespace Drop;
using namespace Drop::Native;
using namespace Drop::Channel;

namespace {

auto read_file(const FS::Path &path) -> std::string {
  std::ifstream stream{path, std::ios::binary};
  std::stringstream buffer;
  buffer << stream.rdbuf();
  return buffer.str();
}

auto sorted_names(const DropItems &items) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto &item : items)
    names.push_back(item.get_name());
  std::ranges::sort(names);
  return names;
}

} // namespace

TEST_CASE("Slow promises materialize in parallel",
          "[Integration][Promises]") {
  TempWorkspace workspace;
  MockScopedAccess access;
  PayloadResolver resolver{access};

  static constexpr auto delay = std::chrono::milliseconds{200};
  const auto promise_count = ThreadPool::get_thread_count();
  REQUIRE(promise_count >= 2);

  DragPayload payload{};
  for (usize i = 0; i < promise_count; ++i)
    payload.promises.push_back(make_scope<WritingPromise>(
        fmt::format("slow_{}.txt", i), fmt::format("contents {}", i), delay));

  const auto start = std::chrono::steady_clock::now();
  const auto items = resolver.resolve(payload);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(items.size() == promise_count);
  // Sequential materialization would take promise_count * delay.
  REQUIRE(elapsed < delay * static_cast<int>(promise_count));

  for (const auto &item : items) {
    REQUIRE(item.is_from_promise());
    const FS::Path path{item.get_path()};
    REQUIRE(read_file(path).starts_with("contents "));
  }
}

TEST_CASE("Mixed promise outcomes reach the UI as one batch",
          "[Integration][Promises]") {
  TempWorkspace workspace;
  MockScopedAccess access;
  auto ends = MethodChannel::create_pair(std::string{channel_name});
  NativeDropHost host{ends.first, access};

  std::vector<DropItems> batches;
  ends.second->set_method_call_handler(
      [&batches](const MethodCall &call) -> MethodResult {
        if (const auto *wire =
                std::get_if<std::vector<WireItem>>(&call.arguments))
          batches.push_back(decode_items(*wire));
        return true;
      });

  const auto existing = workspace.write_file(workspace.outside() / "kept.txt");

  DragPayload payload{};
  payload.promises.push_back(make_scope<WritingPromise>(
      "late.txt", "late", std::chrono::milliseconds{50}));
  payload.promises.push_back(make_scope<FailingPromise>());
  payload.promises.push_back(make_scope<FixedPathPromise>(existing));
  payload.promises.push_back(make_scope<FixedPathPromise>(existing));
  payload.links = {"https://example.com/page", "file:///etc/hosts"};

  auto session = host.create_drag_session({.height = 100.0F, .flip_y = false});
  session->dragging_entered(Position{5.0F, 5.0F});
  REQUIRE(session->perform_drag_operation(payload));

  // Resolved before the UI is ready, so nothing has arrived yet.
  REQUIRE(batches.empty());
  host.handle_did_finish_launching();
  host.ready_for_global_drops();

  REQUIRE(batches.size() == 1);
  const auto &batch = batches[0];
  REQUIRE(sorted_names(batch) ==
          std::vector<std::string>{"Dropped URL.txt", "kept.txt", "late.txt"});

  const auto kept = std::ranges::find_if(batch, [&](const DropItem &item) {
    return item.get_path() == existing.string();
  });
  REQUIRE(kept != batch.end());
  // Outside the private storage, so access survives the drop.
  REQUIRE(kept->get_origin_bookmark().has_value());
  REQUIRE(kept->is_from_promise());
}

TEST_CASE("Gestures get separate drop directories",
          "[Integration][Promises]") {
  TempWorkspace workspace;
  MockScopedAccess access;
  PayloadResolver resolver{access};

  DragPayload first{};
  first.promises.push_back(make_scope<WritingPromise>("same.txt", "first"));
  DragPayload second{};
  second.promises.push_back(make_scope<WritingPromise>("same.txt", "second"));

  const auto first_items = resolver.resolve(first);
  const auto second_items = resolver.resolve(second);

  REQUIRE(first_items.size() == 1);
  REQUIRE(second_items.size() == 1);
  REQUIRE(first_items[0].get_path() != second_items[0].get_path());
  REQUIRE(read_file(first_items[0].get_path()) == "first");
  REQUIRE(read_file(second_items[0].get_path()) == "second");
}
