#include "channel/ItemCodec.hpp"
#include "channel/MethodChannel.hpp"

#include "Exception.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace Drop;
using namespace Drop::Channel;

TEST_CASE("Wire names", "[MethodChannel]") {
  REQUIRE(to_wire_name(Method::Entered) == "entered");
  REQUIRE(to_wire_name(Method::PerformOperationNative) ==
          "performOperation_native");
  REQUIRE(parse_method("readyForGlobalDrops") == Method::ReadyForGlobalDrops);
  REQUIRE(parse_method("stopAccessingSecurityScopedResource") ==
          Method::StopAccessingSecurityScopedResource);
  REQUIRE_FALSE(parse_method("performOperation_macos").has_value());
  REQUIRE_FALSE(parse_method("").has_value());
}

TEST_CASE("Paired channel ends", "[MethodChannel]") {
  auto [native_end, ui_end] = MethodChannel::create_pair("desktop_drop");

  SECTION("No handler drops the message") {
    REQUIRE_FALSE(native_end->invoke_method(Method::Exited).has_value());
    REQUIRE(native_end->get_sent_count() == 1);
  }

  SECTION("Handler result travels back") {
    std::vector<std::string> received;
    ui_end->set_method_call_handler(
        [&received](const MethodCall &call) -> MethodResult {
          received.push_back(call.method);
          return std::get<Position>(call.arguments).x > 0.0F;
        });

    REQUIRE(native_end->invoke_method(Method::Entered, Position{3.0F, 4.0F}) ==
            true);
    REQUIRE(received == std::vector<std::string>{"entered"});
  }

  SECTION("Handler exceptions reach the caller") {
    ui_end->set_method_call_handler([](const MethodCall &call) -> MethodResult {
      throw ProtocolException{call.method, "nope"};
    });

    REQUIRE_THROWS_AS(native_end->invoke_method(MethodCall{"bogus"}),
                      ProtocolException);
  }

  SECTION("A vanished peer drops the message") {
    ui_end.reset();
    REQUIRE_FALSE(native_end->invoke_method(Method::Exited).has_value());
  }
}

TEST_CASE("Item codec", "[MethodChannel]") {
  SECTION("Files keep bookmark and promise flag") {
    const DropItem item = FileItem{
        .path = "/tmp/a.txt", .origin_bookmark = Bytes{1, 2}, .from_promise = true};
    const auto wire = encode_item(item);

    REQUIRE(wire.path == "/tmp/a.txt");
    REQUIRE_FALSE(wire.data.has_value());
    REQUIRE(decode_item(wire) == item);
  }

  SECTION("Directories") {
    const DropItem item = DirectoryItem{.path = "/tmp/folder"};
    const auto decoded = decode_item(encode_item(item));
    REQUIRE(decoded.is<DirectoryItem>());
  }

  SECTION("Memory items get a fresh path on the UI side") {
    const DropItem item =
        make_memory_item("hello", "Dropped Text.txt", "text/plain");
    const auto decoded = decode_item(encode_item(item));

    REQUIRE(decoded.is<MemoryItem>());
    REQUIRE(read_as_text(decoded) == "hello");
    REQUIRE(decoded.get_name() == "Dropped Text.txt");
    REQUIRE(is_memory_path(decoded.get_path()));
  }

  SECTION("Items without path or data are malformed") {
    REQUIRE_THROWS_AS(decode_item(WireItem{}), ProtocolException);
  }
}
