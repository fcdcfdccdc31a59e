#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/Edge.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/Vertex.hpp"
#include "util/AllocPool.hpp"

#include <boost/dynamic_bitset.hpp>

#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace mcgs {

/*
 * SearchGraph owns every vertex and edge of the search, stored in util::AllocPool arenas and
 * addressed by index. A transposition table maps each distinct state to its unique vertex.
 *
 * Locking discipline:
 *
 * - Navigation (vertex(), edge(), for_each_child(), for_each_parent(), Edge::target(), statistics
 *   and traversal marks) is lock-free and may run concurrently with anything except prune() and
 *   clear().
 *
 * - find_vertex() and is_reachable() read the transposition table or follow many links, and
 *   require at least a shared lock on mutex().
 *
 * - find_or_create_root(), append_child(), resolve_edge() and expand_vertex() require a unique lock
 *   on mutex().
 *
 * - prune() and clear() require that no other thread is touching the graph at all.
 *
 * None of the methods acquire mutex() themselves.
 */
template <core::concepts::Game Game>
class SearchGraph {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Payoff = Game::Payoff;
  using Rules = Game::Rules;
  using Vertex = mcgs::Vertex<Game>;
  using Edge = mcgs::Edge<Game>;
  using Target = Edge::Target;

  /*
   * Compacts the arenas down to the vertices reachable from a set of roots. Follows the usual
   * scan / prepare / defrag / remap sequence.
   */
  class Defragmenter {
   public:
    Defragmenter(SearchGraph* graph);
    void scan(const std::vector<vertex_index_t>& roots);
    void prepare();
    void defrag();
    void remap(vertex_index_t& v) const { v = vertex_index_remappings_[v]; }

   private:
    using bitset_t = boost::dynamic_bitset<>;
    using index_vec_t = std::vector<util::pool_index_t>;

    static void init_remapping(index_vec_t&, const bitset_t&);
    void relink();

    SearchGraph* graph_;
    bitset_t vertex_bitset_;
    bitset_t edge_bitset_;

    index_vec_t vertex_index_remappings_;
    index_vec_t edge_index_remappings_;
  };

  SearchGraph() = default;
  SearchGraph(const SearchGraph&) = delete;
  SearchGraph& operator=(const SearchGraph&) = delete;

  std::shared_mutex& mutex() const { return mutex_; }

  // Returns the vertex for state, creating an unexpanded one if needed.
  vertex_index_t find_or_create_root(const State& state);

  // Returns the vertex for state, or kNullIndex if there is none.
  vertex_index_t find_vertex(const State& state) const;

  // Appends an unexpanded edge for action to v's child list.
  edge_index_t append_child(vertex_index_t v, const Action& action);

  /*
   * Resolves the unexpanded edge e, whose action leads to next_state.
   *
   * If next_state has no vertex yet, one is created and the result is kExpanded(new vertex). If a
   * vertex already exists and a path of expanded edges leads from it back to e's source, the result
   * is kCycle(existing); otherwise kExpanded(existing). In every case e is appended to the target's
   * parent list.
   *
   * If created is non-null, *created is set to whether a new vertex was created.
   */
  Target resolve_edge(edge_index_t e, const State& next_state, bool* created = nullptr);

  /*
   * Enumerates the legal actions of v's state and appends one unexpanded child per distinct
   * resulting state, then marks v expanded. Terminal vertices are marked expanded with no children.
   *
   * Returns false, doing nothing, if v was already expanded.
   */
  bool expand_vertex(vertex_index_t v);

  // Depth-first search over kExpanded edges.
  bool is_reachable(vertex_index_t from, vertex_index_t to) const;

  /*
   * Removes every vertex not reachable from roots (following both kExpanded and kCycle targets),
   * along with every edge whose source is removed. Indices are compacted; roots are remapped in
   * place. Child order is preserved.
   */
  void prune(std::vector<vertex_index_t>& roots);

  // Marks every vertex not reachable from root as detached, and every other vertex as attached.
  void detach_unreachable(vertex_index_t root);

  // Attaches v and every detached vertex reachable from it. Requires the exclusive lock.
  void reattach(vertex_index_t v);

  void clear();

  Vertex& vertex(vertex_index_t v) { return vertex_pool_[v]; }
  const Vertex& vertex(vertex_index_t v) const { return vertex_pool_[v]; }
  Edge& edge(edge_index_t e) { return edge_pool_[e]; }
  const Edge& edge(edge_index_t e) const { return edge_pool_[e]; }

  uint64_t num_vertices() const { return vertex_pool_.size(); }
  uint64_t num_edges() const { return edge_pool_.size(); }

  // f(edge_index_t) is called for each child edge of v, in append order.
  template <typename F>
  void for_each_child(vertex_index_t v, F&& f) const;

  // f(edge_index_t) is called for each parent edge of v, in append order.
  template <typename F>
  void for_each_parent(vertex_index_t v, F&& f) const;

  std::vector<edge_index_t> children(vertex_index_t v) const;
  std::vector<edge_index_t> parents(vertex_index_t v) const;

 private:
  using map_t = std::unordered_map<State, vertex_index_t>;

  vertex_index_t create_vertex(const State& state);
  void link_child(vertex_index_t v, edge_index_t e);
  void link_parent(vertex_index_t v, edge_index_t e);

  map_t map_;
  util::AllocPool<Vertex> vertex_pool_;
  util::AllocPool<Edge> edge_pool_;
  mutable std::shared_mutex mutex_;
};

}  // namespace mcgs

#include "inline/mcgs/SearchGraph.inl"
