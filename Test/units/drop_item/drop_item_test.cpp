#include "DropItem.hpp"
#include "Formatters.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace Drop;

TEST_CASE("Memory items get a reserved unique path", "[DropItem]") {
  const auto first = make_memory_item("hello", "Dropped Text.txt",
                                      "text/plain; charset=utf-8");
  const auto second = make_memory_item("hello", "Dropped Text.txt",
                                       "text/plain; charset=utf-8");

  REQUIRE(first.path.starts_with("memory://drop/"));
  REQUIRE(first.path.ends_with("/Dropped Text.txt"));
  REQUIRE(first.path != second.path);
  REQUIRE(first.byte_length == 5);
  REQUIRE(is_memory_path(first.path));
  REQUIRE_FALSE(is_memory_path("/tmp/memory://drop"));
}

TEST_CASE("Memory item defaults", "[DropItem]") {
  const auto item = make_memory_item(Bytes{1, 2, 3}, "", "");

  REQUIRE(item.name == "Dropped.data");
  REQUIRE(item.mime_type == "application/octet-stream");
  REQUIRE(item.byte_length == 3);
  REQUIRE_FALSE(item.from_promise);
}

TEST_CASE("Visiting every alternative", "[DropItem]") {
  DropItems items{
      FileItem{.path = "/tmp/a.txt"},
      DirectoryItem{.path = "/tmp/folder"},
      make_memory_item("x", "Dropped Text.txt", "text/plain"),
  };

  std::vector<std::string> kinds;
  for (const auto &item : items) {
    kinds.push_back(item.visit(Overloaded{
        [](const FileItem &) { return std::string{"file"}; },
        [](const DirectoryItem &) { return std::string{"directory"}; },
        [](const MemoryItem &) { return std::string{"memory"}; },
    }));
  }

  REQUIRE(kinds == std::vector<std::string>{"file", "directory", "memory"});
  REQUIRE(items[0].get_name() == "a.txt");
  REQUIRE(items[1].get_path() == "/tmp/folder");
  REQUIRE_FALSE(items[0].get_mime_type().has_value());
  REQUIRE(items[2].get_mime_type() == "text/plain");
  info("{}", items);
}

TEST_CASE("Text helpers", "[DropItem]") {
  SECTION("Plain text reads back") {
    const DropItem item = make_memory_item("dropped words", "Dropped Text.txt",
                                           "text/plain; charset=utf-8");
    REQUIRE(is_memory_backed(item));
    REQUIRE(is_text_like(item));
    REQUIRE(read_as_text(item) == "dropped words");
  }

  SECTION("RTF counts as text") {
    const DropItem item =
        make_memory_item("{\\rtf1 x}", "Dropped Text.rtf", "application/rtf");
    REQUIRE(is_text_like(item));
  }

  SECTION("Files are not memory backed") {
    const DropItem item = FileItem{.path = "/tmp/a.txt"};
    REQUIRE_FALSE(is_memory_backed(item));
    REQUIRE_FALSE(read_as_text(item).has_value());
  }

  SECTION("Binary data is not text") {
    const DropItem item = make_memory_item(Bytes{0, 1}, "blob", "image/png");
    REQUIRE_FALSE(is_text_like(item));
    REQUIRE_FALSE(read_as_text(item).has_value());
  }

  SECTION("Uri lists skip comments and blank lines") {
    const DropItem item = make_memory_item(
        "# comment\r\nhttps://example.com/a\r\n\r\n  https://example.com/b  \n",
        "Dropped URL.txt", "text/uri-list");
    REQUIRE(read_as_uris(item) == std::vector<std::string>{
                                      "https://example.com/a",
                                      "https://example.com/b",
                                  });
  }

  SECTION("Other mime types have no uris") {
    const DropItem item =
        make_memory_item("https://example.com", "x.txt", "text/plain");
    REQUIRE(read_as_uris(item).empty());
  }
}

TEST_CASE("Equality covers metadata", "[DropItem]") {
  const DropItem plain = FileItem{.path = "/tmp/a.txt"};
  const DropItem promised = FileItem{.path = "/tmp/a.txt", .from_promise = true};
  const DropItem directory = DirectoryItem{.path = "/tmp/a.txt"};

  REQUIRE(plain == DropItem{FileItem{.path = "/tmp/a.txt"}});
  REQUIRE_FALSE(plain == promised);
  REQUIRE_FALSE(plain == directory);
}
