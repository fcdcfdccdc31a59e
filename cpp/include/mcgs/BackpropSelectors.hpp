#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/TypeDefs.hpp"

namespace mcgs {

/*
 * Propagates through every parent edge that is currently a best child of its source vertex, in the
 * UcbSelector::is_best_child() sense. With transpositions this may update several parents of the
 * same vertex in one pass.
 */
template <core::concepts::Game Game>
class BestParentBackpropSelector {
 public:
  using SearchGraph = mcgs::SearchGraph<Game>;

  BestParentBackpropSelector(const ManagerParams& params) : explore_bias_(params.explore_bias) {}

  bool include(const SearchGraph& graph, edge_index_t e) const;

 private:
  const double explore_bias_;
};

/*
 * Propagates only through the first parent edge of each vertex, i.e. the edge that created it.
 * Backprop then follows a single chain of edges, as it would in a tree search.
 */
template <core::concepts::Game Game>
class FirstParentBackpropSelector {
 public:
  using SearchGraph = mcgs::SearchGraph<Game>;

  FirstParentBackpropSelector(const ManagerParams&) {}

  bool include(const SearchGraph& graph, edge_index_t e) const;
};

}  // namespace mcgs

#include "inline/mcgs/BackpropSelectors.inl"
