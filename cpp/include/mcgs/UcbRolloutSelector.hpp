#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/TypeDefs.hpp"

#include <random>

namespace mcgs {

// Descends through the child with maximal UCB1 score. See UcbSelector.
template <core::concepts::Game Game>
class UcbRolloutSelector {
 public:
  using SearchGraph = mcgs::SearchGraph<Game>;

  UcbRolloutSelector(const ManagerParams& params) : explore_bias_(params.explore_bias) {}

  edge_index_t select(const SearchGraph& graph, vertex_index_t v, std::mt19937& prng) const;

 private:
  const double explore_bias_;
};

}  // namespace mcgs

#include "inline/mcgs/UcbRolloutSelector.inl"
