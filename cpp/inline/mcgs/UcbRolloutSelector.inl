#include "mcgs/UcbRolloutSelector.hpp"

#include "mcgs/UcbSelector.hpp"

namespace mcgs {

template <core::concepts::Game Game>
edge_index_t UcbRolloutSelector<Game>::select(const SearchGraph& graph, vertex_index_t v,
                                              std::mt19937& prng) const {
  UcbSelector<Game> selector(graph, v, explore_bias_);
  return selector.edge(selector.select(prng));
}

}  // namespace mcgs
