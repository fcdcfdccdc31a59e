#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/TypeDefs.hpp"

#include <concepts>

namespace mcgs {
namespace concepts {

/*
 * Decides whether a parent edge receives the payoff that is being propagated up through its
 * target vertex. include() is evaluated before any statistics of the current pass are updated.
 */
template <class BS, class Game>
concept BackpropSelector = requires(const BS& selector, const ManagerParams& params,
                                    const mcgs::SearchGraph<Game>& graph, edge_index_t e) {
  requires std::constructible_from<BS, const ManagerParams&>;
  { selector.include(graph, e) } -> std::same_as<bool>;
};

}  // namespace concepts
}  // namespace mcgs
