#pragma once

#include "Concepts.hpp"
#include "Logger.hpp"
#include "Types.hpp"

#include <magic_enum.hpp>

namespace Drop {

/**
 * @brief Minimal state holder with enter/leave hooks. Self transitions are
 * real transitions: leaving and re-entering a state fires both hooks, which is
 * how a region reports repeated hover updates.
 */
template <IsEnum StateEnum> class FiniteStateMachine {
private:
  StateEnum current_state;
  StateEnum previous_state;
  u64 transitions{0};

public:
  explicit FiniteStateMachine(StateEnum initial_state)
      : current_state(initial_state), previous_state(initial_state) {}
  virtual ~FiniteStateMachine() = default;

  void transition_to(StateEnum new_state) {
    on_leave_state(current_state);
    previous_state = current_state;
    current_state = new_state;
    ++transitions;
    on_enter_state(new_state);
  }

  auto get_current_state() const { return current_state; }
  auto get_previous_state() const { return previous_state; }
  auto get_transition_count() const -> u64 { return transitions; }

  auto is(StateEnum state) const -> bool { return current_state == state; }

protected:
  virtual auto on_enter_state(StateEnum state) -> void {
    trace("Entering state: {}", magic_enum::enum_name(state));
  }
  virtual auto on_leave_state(StateEnum state) -> void {
    trace("Leaving state: {}", magic_enum::enum_name(state));
  }
};

} // namespace Drop
