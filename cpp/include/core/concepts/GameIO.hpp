#pragma once

#include <concepts>
#include <string>

namespace core {
namespace concepts {

template <typename GI, typename State, typename Action>
concept GameIO = requires(const State& state, const Action& action) {
  { GI::action_to_str(action) } -> std::same_as<std::string>;

  // compact_state_repr is used in testing and debugging
  { GI::compact_state_repr(state) } -> std::same_as<std::string>;
};

}  // namespace concepts
}  // namespace core
