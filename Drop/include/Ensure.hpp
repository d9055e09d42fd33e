#pragma once

#include "Exception.hpp"
#include "Logger.hpp"

namespace Drop {

/**
 * @brief Checks a caller precondition. On failure the formatted message is
 * logged and a StateMisuseException is thrown, so misuse surfaces at the call
 * site instead of corrupting listener or region state.
 */
template <typename... Args>
void ensure(bool condition, fmt::format_string<Args...> message,
            Args &&...args) {
  if (!condition) {
    auto formatted_message = fmt::format(message, std::forward<Args>(args)...);
    error("{}", formatted_message);
    throw StateMisuseException{formatted_message};
  }
}

} // namespace Drop
