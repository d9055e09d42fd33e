#pragma once

#include <concepts>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <glm/glm.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <span>
#include <string_view>
#include <vector>

#include "DropItem.hpp"
#include "Event.hpp"
#include "region/DropRegion.hpp"

template <typename T>
struct fmt::formatter<std::vector<T>> : formatter<const char *> {
  auto format(const std::vector<T> &vector, format_context &ctx) const
      -> decltype(ctx.out()) {
    return formatter<const char *>::format(
        fmt::format("{}", fmt::join(vector, ", ")).data(), ctx);
  }
};

template <glm::length_t L, typename T, glm::qualifier Q>
struct fmt::formatter<glm::vec<L, T, Q>> : formatter<const char *> {
  auto format(const glm::vec<L, T, Q> &vector, format_context &ctx) const
      -> decltype(ctx.out()) {
    const auto span = std::span{glm::value_ptr(vector), L};
    return formatter<const char *>::format(
        fmt::format("{}", fmt::join(span, ", ")).data(), ctx);
  }
};

template <> struct fmt::formatter<Drop::DropItem> : formatter<const char *> {
  auto format(const Drop::DropItem &item, format_context &ctx) const
      -> decltype(ctx.out());
};

template <> struct fmt::formatter<Drop::EventType> : formatter<const char *> {
  auto format(const Drop::EventType &type, format_context &ctx) const
      -> decltype(ctx.out());
};

template <>
struct fmt::formatter<Drop::RegionStatus> : formatter<const char *> {
  auto format(const Drop::RegionStatus &status, format_context &ctx) const
      -> decltype(ctx.out());
};

template <std::derived_from<Drop::DropEvent> T>
struct fmt::formatter<T> : formatter<const char *> {
  auto format(const T &event, format_context &ctx) const
      -> decltype(ctx.out()) {
    return formatter<const char *>::format(event.to_string().c_str(), ctx);
  }
};
