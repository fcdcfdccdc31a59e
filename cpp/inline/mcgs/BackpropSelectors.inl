#include "mcgs/BackpropSelectors.hpp"

#include "mcgs/UcbSelector.hpp"
#include "util/Asserts.hpp"

namespace mcgs {

template <core::concepts::Game Game>
bool BestParentBackpropSelector<Game>::include(const SearchGraph& graph, edge_index_t e) const {
  UcbSelector<Game> selector(graph, graph.edge(e).source, explore_bias_);
  return selector.is_best_child(e);
}

template <core::concepts::Game Game>
bool FirstParentBackpropSelector<Game>::include(const SearchGraph& graph, edge_index_t e) const {
  auto target = graph.edge(e).target();
  DEBUG_ASSERT(target.kind != SearchGraph::Edge::kUnexpanded, "edge {} is unexpanded", e);
  return graph.vertex(target.vertex).first_parent.load(std::memory_order_acquire) == e;
}

}  // namespace mcgs
