#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/TypeDefs.hpp"

#include <Eigen/Core>

#include <random>
#include <string>
#include <vector>

namespace mcgs {

// Per-child UCB outcome, as reported in SearchResults.
struct UcbResult {
  enum kind_t : int8_t { kSelect, kValue, kInvalid };

  std::string to_str() const;

  kind_t kind = kInvalid;
  double value = 0;  // only meaningful for kValue
};

/*
 * Snapshot of a vertex's children, scored by UCB1:
 *
 * UCB(i) = Q(i) / N(i) + explore_bias * sqrt(ln(sum(N)) / N(i))
 *
 * where N(i) is the visit count of child edge i and Q(i) is its accumulated score for the player
 * to move at the vertex. Children with N(i) == 0 score +inf and are never masked. Visited children
 * proven cyclic (kCycle edges and edges into cyclic vertices) are masked out, unless every child is
 * masked.
 *
 * The snapshot is taken without locking, so concurrent increments may be partially reflected.
 */
template <core::concepts::Game Game>
class UcbSelector {
 public:
  using SearchGraph = mcgs::SearchGraph<Game>;
  using Edge = SearchGraph::Edge;
  using Array = Eigen::Array<double, Eigen::Dynamic, 1>;

  UcbSelector(const SearchGraph& graph, vertex_index_t v, double explore_bias);

  int num_children() const { return edges_.size(); }
  edge_index_t edge(int i) const { return edges_[i]; }

  /*
   * Returns the index of a maximal-UCB unmasked child, choosing uniformly among exact ties by
   * reservoir sampling. Throws SearchError(kSelector) on a NaN score.
   */
  int select(std::mt19937& prng) const;

  /*
   * A child is a best child if it is unvisited, or if no unmasked sibling is unvisited and its UCB
   * ties or exceeds the maximum over unmasked children. Throws SearchError(kSelector) on a NaN
   * score.
   */
  bool is_best_child(edge_index_t e) const;

  UcbResult result(int i) const;

  core::player_index_t player;
  Array N;     // child edge visit count
  Array Q;     // child edge accumulated score for player
  Array mask;  // 1 for selectable children, 0 for visited cyclic children
  Array UCB;

 private:
  int index_of(edge_index_t e) const;
  void check_valid(int i) const;

  std::vector<edge_index_t> edges_;
};

}  // namespace mcgs

#include "inline/mcgs/UcbSelector.inl"
