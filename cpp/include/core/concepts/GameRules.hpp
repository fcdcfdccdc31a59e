#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <functional>
#include <optional>

namespace core {
namespace concepts {

template <typename GR, typename State, typename Action, typename Payoff>
concept GameRules =
  requires(const State& const_state, State& state, const Action& action,
           std::function<core::loop_control_t(const Action&)> f) {
    { GR::get_current_player(const_state) } -> std::same_as<core::player_index_t>;

    // Calls f(action) for each legal action, stopping early if f returns kBreak.
    { GR::for_each_action(const_state, f) };

    { GR::apply(state, action) };

    // Returns the outcome of the game if const_state is terminal, and std::nullopt otherwise.
    { GR::payoff_of(const_state) } -> std::same_as<std::optional<Payoff>>;
  };

}  // namespace concepts
}  // namespace core
