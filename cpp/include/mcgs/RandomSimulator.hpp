#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/ManagerParams.hpp"

#include <random>

namespace mcgs {

/*
 * Plays uniformly random legal actions until the game reports a payoff.
 *
 * Throws SearchError(kNoTerminalPayoff) if it reaches a state that has neither a payoff nor a legal
 * action.
 */
template <core::concepts::Game Game>
class RandomSimulator {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Payoff = Game::Payoff;
  using Rules = Game::Rules;
  using IO = Game::IO;

  RandomSimulator(const ManagerParams&) {}

  Payoff simulate(const State& state, std::mt19937& prng) const;
};

}  // namespace mcgs

#include "inline/mcgs/RandomSimulator.inl"
