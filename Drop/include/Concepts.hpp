#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>

namespace Drop {

template <class T>
concept IsEnum = std::is_enum_v<T>;

template <class T>
concept IsNumber = std::is_arithmetic_v<T>;

template <class T, class To>
concept CStrConvertibleTo = std::convertible_to<T, To> || requires(const T &t) {
  { t.c_str() } -> std::convertible_to<To>;
} || requires(const T &t) {
  { t.data() } -> std::convertible_to<To>;
};

template <class T>
concept StringLike =
    std::is_same_v<const char *, T> || std::is_same_v<std::string_view, T> ||
    std::is_same_v<std::string, T> || CStrConvertibleTo<T, const char *>;

// Anything with a callable visit over the drop item alternatives.
template <class T, class... Alternatives>
concept VisitsAll = (std::invocable<T, const Alternatives &> && ...);

} // namespace Drop
