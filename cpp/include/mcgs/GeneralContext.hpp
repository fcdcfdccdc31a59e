#pragma once

#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/concepts/TraitsConcept.hpp"

namespace mcgs {

/*
 * Everything the search phases need that is shared by all workers: the graph, the parameters, and
 * the strategy instances built from them.
 */
template <mcgs::concepts::Traits Traits>
struct GeneralContext {
  using Game = Traits::Game;
  using SearchGraph = mcgs::SearchGraph<Game>;
  using RolloutSelector = Traits::RolloutSelector;
  using BackpropSelector = Traits::BackpropSelector;
  using Simulator = Traits::Simulator;

  GeneralContext(const ManagerParams& p, SearchGraph& g)
      : params(p), graph(g), rollout_selector(p), backprop_selector(p), simulator(p) {}

  const ManagerParams& params;
  SearchGraph& graph;
  const RolloutSelector rollout_selector;
  const BackpropSelector backprop_selector;
  const Simulator simulator;
};

}  // namespace mcgs
