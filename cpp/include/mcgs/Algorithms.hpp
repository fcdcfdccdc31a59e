#pragma once

#include "mcgs/GeneralContext.hpp"
#include "mcgs/SearchContext.hpp"
#include "mcgs/SearchError.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/SearchResults.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/concepts/TraitsConcept.hpp"

#include <cstdint>

namespace mcgs {

/*
 * The four phases of a search pass: rollout, expansion, simulation and backprop.
 *
 * All methods are static. State shared by all workers lives in the GeneralContext; per-worker state
 * lives in the SearchContext.
 */
template <mcgs::concepts::Traits Traits>
class Algorithms {
 public:
  using Game = Traits::Game;
  using State = Game::State;
  using Payoff = Game::Payoff;
  using Rules = Game::Rules;
  using IO = Game::IO;
  using GeneralContext = mcgs::GeneralContext<Traits>;
  using SearchContext = mcgs::SearchContext<Traits>;
  using SearchGraph = mcgs::SearchGraph<Game>;
  using SearchResults = mcgs::SearchResults<Game>;
  using Vertex = SearchGraph::Vertex;
  using Edge = SearchGraph::Edge;
  using Target = SearchGraph::Target;

  struct RolloutResult {
    enum kind_t : int8_t {
      kRootTerminal,    // the root itself is terminal; there is nothing to search
      kKnownPayoff,     // stopped at a non-root vertex whose payoff is known
      kUnexpandedEdge   // stopped at an edge that needs expansion
    };

    kind_t kind;
    vertex_index_t vertex = kNullIndex;  // the vertex where the descent stopped
    edge_index_t edge = kNullIndex;      // the last edge of the search path, if any
  };

  struct ExpansionResult {
    enum kind_t : int8_t {
      kNewVertex,     // the edge led to a state with no vertex; one was created and expanded
      kTransposition, // the edge led to an existing vertex; seed estimates the edge from it
      kCycle,         // as kTransposition, but the edge closes a cycle
      kCollision      // another worker resolved the edge first; nothing was done
    };

    kind_t kind;
    Target target;
    Payoff seed = Payoff::zero();
  };

  enum pass_outcome_t : int8_t {
    kRootTerminal,
    kBackpropagated,  // a known payoff or simulation result was propagated
    kExpanded,        // a new vertex was created, simulated and propagated
    kSeeded,          // a transposition or cycle edge was seeded and the seed propagated
    kCollided,
    kCycleDetected
  };

  /*
   * Runs one full pass from context.root. Traversal marks are cleared before returning, even when
   * an exception escapes.
   *
   * A CycleError raised during the rollout is handled here: the edge that closed the loop is
   * penalized and the pass is discarded. Any other SearchError propagates.
   *
   * The outcome is tallied in context.stats.
   */
  static pass_outcome_t iterate(GeneralContext&, SearchContext&);

  /*
   * Descends from context.root, appending each selected edge to context.search_path.
   *
   * Throws CycleError if the worker re-enters an edge it already traversed in this pass, and
   * SearchError(kNoTerminalPayoff) on a non-terminal vertex without children.
   */
  static RolloutResult rollout(GeneralContext&, SearchContext&);

  /*
   * Resolves the unexpanded edge e under the graph's exclusive lock. When e leads to an existing
   * vertex, no simulation is run: the result carries a seed payoff, which is the target's known
   * payoff if there is one, and otherwise the sum of the target's child edge statistics.
   */
  static ExpansionResult expand(GeneralContext&, SearchContext&, edge_index_t e);

  // Sum of simulation_count playouts from v's state.
  static Payoff simulate(GeneralContext&, SearchContext&, vertex_index_t v);

  /*
   * Folds payoff into leaf_edge, its target vertex and every ancestor edge/vertex admitted by the
   * backprop selector. The upward frontier is computed in full before any statistic is touched.
   *
   * With credit_target false, the leaf's target vertex is left alone. This is how a seed is
   * propagated, since the target's statistics already account for it.
   */
  static void backprop(GeneralContext&, SearchContext&, edge_index_t leaf_edge,
                       const Payoff& payoff, bool credit_target = true);

  // Gives the edge that closed the cycle one zero-score visit.
  static void penalize_cycle(GeneralContext&, SearchContext&, const CycleError&);

  // Clears this worker's traversal marks on every edge touched in the current pass.
  static void end_pass(GeneralContext&, SearchContext&);

  static SearchResults to_results(const GeneralContext&, vertex_index_t root, epoch_t epoch);

 private:
  static Payoff seed_of(const GeneralContext&, vertex_index_t target);
  static void collect_backprop_frontier(GeneralContext&, SearchContext&, edge_index_t leaf_edge,
                                        bool credit_target);
  static void visit_vertex(SearchContext&, vertex_index_t v);
  static void refine(GeneralContext&, SearchContext&, vertex_index_t v);
};

}  // namespace mcgs

#include "inline/mcgs/Algorithms.inl"
