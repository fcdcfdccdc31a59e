#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/ManagerParams.hpp"

#include <concepts>
#include <random>

namespace mcgs {
namespace concepts {

// Plays out a single game from a non-terminal state, without touching the search graph.
template <class Sim, class Game>
concept Simulator = requires(const Sim& simulator, const ManagerParams& params,
                             const typename Game::State& state, std::mt19937& prng) {
  requires std::constructible_from<Sim, const ManagerParams&>;
  { simulator.simulate(state, prng) } -> std::same_as<typename Game::Payoff>;
};

}  // namespace concepts
}  // namespace mcgs
