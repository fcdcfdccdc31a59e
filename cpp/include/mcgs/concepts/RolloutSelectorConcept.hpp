#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/TypeDefs.hpp"

#include <concepts>
#include <random>

namespace mcgs {
namespace concepts {

/*
 * Chooses which child edge of an expanded, non-terminal vertex the rollout descends through.
 */
template <class RS, class Game>
concept RolloutSelector = requires(const RS& selector, const ManagerParams& params,
                                   const mcgs::SearchGraph<Game>& graph, vertex_index_t v,
                                   std::mt19937& prng) {
  requires std::constructible_from<RS, const ManagerParams&>;
  { selector.select(graph, v, prng) } -> std::same_as<edge_index_t>;
};

}  // namespace concepts
}  // namespace mcgs
