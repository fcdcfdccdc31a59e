#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/UcbSelector.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mcgs {

// Counters accumulated over one Manager::run_round() call.
struct RoundStats {
  RoundStats& operator+=(const RoundStats& other);
  std::string to_str() const;

  int iterations = 0;      // completed passes, of any outcome
  int expansions = 0;      // passes that created a new vertex
  int transpositions = 0;  // passes that resolved an edge to an existing vertex
  int cycles = 0;          // passes discarded because of a cycle
  int collisions = 0;      // passes discarded because another worker resolved the same edge
  int simulations = 0;     // random playouts
};

/*
 * Report produced by Manager::run_round(): one entry per child edge of the root, in child order.
 */
template <core::concepts::Game Game>
struct SearchResults {
  using Action = Game::Action;
  using Payoff = Game::Payoff;

  struct ActionStats {
    Action action;
    edge_index_t edge;
    Payoff payoff;  // the edge's statistics at the end of the round
    UcbResult ucb;
  };

  std::string to_str() const;

  epoch_t epoch = 0;
  uint32_t root_visits = 0;
  core::player_index_t active_player = -1;
  std::vector<ActionStats> actions;
  RoundStats stats;
};

}  // namespace mcgs

#include "inline/mcgs/SearchResults.inl"
