#pragma once

#include "core/concepts/GameConstants.hpp"
#include "core/concepts/GameIO.hpp"
#include "core/concepts/GameRules.hpp"
#include "core/concepts/Payoff.hpp"

#include <concepts>
#include <functional>

namespace core {

namespace concepts {

/*
 * All Game classes G must satisfy core::concepts::Game<G>.
 *
 * States are stored by value inside the search graph's arenas, which never run destructors, so
 * they must be trivially destructible. They are deduplicated through std::hash<G::State>.
 */
template <class G>
concept Game = requires {
  requires core::concepts::GameConstants<typename G::Constants>;

  requires std::copyable<typename G::State>;
  requires std::default_initializable<typename G::State>;
  requires std::equality_comparable<typename G::State>;
  requires std::is_trivially_destructible_v<typename G::State>;
  requires requires(const typename G::State& s) {
    { std::hash<typename G::State>{}(s) } -> std::convertible_to<size_t>;
  };

  requires std::copyable<typename G::Action>;
  requires std::default_initializable<typename G::Action>;
  requires std::equality_comparable<typename G::Action>;
  requires std::is_trivially_destructible_v<typename G::Action>;

  requires core::concepts::Payoff<typename G::Payoff>;
  requires core::concepts::Statistics<typename G::Statistics, typename G::Payoff>;

  requires core::concepts::GameRules<typename G::Rules, typename G::State, typename G::Action,
                                     typename G::Payoff>;
  requires core::concepts::GameIO<typename G::IO, typename G::State, typename G::Action>;
};

}  // namespace concepts

}  // namespace core
