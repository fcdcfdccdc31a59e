#pragma once

#include "mcgs/Constants.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/SearchResults.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/concepts/TraitsConcept.hpp"

#include <boost/dynamic_bitset.hpp>

#include <random>
#include <string>
#include <vector>

namespace mcgs {

// Per-worker scratch state for one search pass.
template <mcgs::concepts::Traits Traits>
struct SearchContext {
  using Game = Traits::Game;
  using SearchGraph = mcgs::SearchGraph<Game>;
  using search_path_t = std::vector<edge_index_t>;

  SearchContext(worker_id_t w, uint32_t seed) : worker_id(w), prng(seed) {}

  int log_prefix_n() const { return kThreadWhitespaceLength * worker_id; }
  void init(vertex_index_t root_vertex, epoch_t e);
  void start_pass();
  std::string search_path_str(const SearchGraph& graph) const;  // slow, for debugging

  const worker_id_t worker_id;
  epoch_t epoch = 0;
  std::mt19937 prng;
  vertex_index_t root = kNullIndex;

  RoundStats stats;  // reset by init()

  search_path_t search_path;  // edges descended during rollout, root first

  // Every edge whose traversal bits this worker may have set during the current pass.
  std::vector<edge_index_t> touched_edges;

  // backprop scratch
  std::vector<vertex_index_t> backprop_vertices;
  std::vector<edge_index_t> backprop_edges;
  boost::dynamic_bitset<> visited_vertices;
};

}  // namespace mcgs

#include "inline/mcgs/SearchContext.inl"
