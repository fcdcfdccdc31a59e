#include "mcgs/SearchGraph.hpp"

#include "util/Asserts.hpp"

#include <unordered_set>

namespace mcgs {

template <core::concepts::Game Game>
SearchGraph<Game>::Defragmenter::Defragmenter(SearchGraph* graph)
    : graph_(graph),
      vertex_bitset_(graph->num_vertices()),
      edge_bitset_(graph->num_edges()) {}

template <core::concepts::Game Game>
void SearchGraph<Game>::Defragmenter::scan(const std::vector<vertex_index_t>& roots) {
  std::vector<vertex_index_t> queue;
  for (vertex_index_t root : roots) {
    RELEASE_ASSERT(root >= 0 && uint64_t(root) < vertex_bitset_.size(), "bad root {}", root);
    if (vertex_bitset_[root]) continue;
    vertex_bitset_[root] = true;
    queue.push_back(root);
  }

  for (size_t i = 0; i < queue.size(); ++i) {
    graph_->for_each_child(queue[i], [&](edge_index_t e) {
      Target t = graph_->edge(e).target();
      if (t.kind == Edge::kUnexpanded || vertex_bitset_[t.vertex]) return;
      vertex_bitset_[t.vertex] = true;
      queue.push_back(t.vertex);
    });
  }

  // An edge survives iff its source does. Every resolved target of such an edge was scanned above.
  for (edge_index_t e = 0; e < (edge_index_t)edge_bitset_.size(); ++e) {
    edge_bitset_[e] = vertex_bitset_[graph_->edge(e).source];
  }
}

template <core::concepts::Game Game>
void SearchGraph<Game>::Defragmenter::prepare() {
  init_remapping(vertex_index_remappings_, vertex_bitset_);
  init_remapping(edge_index_remappings_, edge_bitset_);
}

template <core::concepts::Game Game>
void SearchGraph<Game>::Defragmenter::defrag() {
  graph_->vertex_pool_.defragment(vertex_bitset_);
  graph_->edge_pool_.defragment(edge_bitset_);

  for (auto it = graph_->map_.begin(); it != graph_->map_.end();) {
    if (!vertex_bitset_[it->second]) {
      it = graph_->map_.erase(it);
    } else {
      it->second = vertex_index_remappings_[it->second];
      ++it;
    }
  }

  relink();
}

template <core::concepts::Game Game>
void SearchGraph<Game>::Defragmenter::init_remapping(index_vec_t& remappings,
                                                     const bitset_t& bitset) {
  remappings.assign(bitset.size(), kNullIndex);

  auto i = bitset.find_first();
  util::pool_index_t k = 0;
  while (i != bitset_t::npos) {
    remappings[i] = k++;
    i = bitset.find_next(i);
  }
}

// The list links hold pre-compaction indices, so rather than remapping them we rebuild both lists
// from scratch. Edges are visited in index order, which preserves each vertex's child order.
template <core::concepts::Game Game>
void SearchGraph<Game>::Defragmenter::relink() {
  for (vertex_index_t v = 0; v < (vertex_index_t)graph_->num_vertices(); ++v) {
    Vertex& vertex = graph_->vertex(v);
    vertex.first_child = kNullIndex;
    vertex.first_parent = kNullIndex;
    vertex.last_child = kNullIndex;
    vertex.last_parent = kNullIndex;
    vertex.num_children = 0;
    vertex.num_parents = 0;
  }

  for (edge_index_t e = 0; e < (edge_index_t)graph_->num_edges(); ++e) {
    Edge& edge = graph_->edge(e);
    edge.source = vertex_index_remappings_[edge.source];
    edge.next_sibling = kNullIndex;
    edge.next_parent = kNullIndex;
    edge.traversals = Traversals();
    graph_->link_child(edge.source, e);

    Target t = edge.target();
    if (t.kind == Edge::kUnexpanded) continue;
    vertex_index_t target = vertex_index_remappings_[t.vertex];
    DEBUG_ASSERT(target >= 0);
    edge.remap_target(target);
    graph_->link_parent(target, e);
  }
}

template <core::concepts::Game Game>
vertex_index_t SearchGraph<Game>::find_or_create_root(const State& state) {
  vertex_index_t v = find_vertex(state);
  if (v != kNullIndex) return v;
  return create_vertex(state);
}

template <core::concepts::Game Game>
vertex_index_t SearchGraph<Game>::find_vertex(const State& state) const {
  auto it = map_.find(state);
  if (it == map_.end()) return kNullIndex;
  return it->second;
}

template <core::concepts::Game Game>
edge_index_t SearchGraph<Game>::append_child(vertex_index_t v, const Action& action) {
  RELEASE_ASSERT(v >= 0 && uint64_t(v) < num_vertices(), "bad vertex {}", v);

  edge_index_t e = edge_pool_.alloc(1);
  Edge& edge = edge_pool_[e];
  edge.action = action;
  edge.source = v;
  link_child(v, e);
  return e;
}

template <core::concepts::Game Game>
typename SearchGraph<Game>::Target SearchGraph<Game>::resolve_edge(edge_index_t e,
                                                                   const State& next_state,
                                                                   bool* created) {
  RELEASE_ASSERT(e >= 0 && uint64_t(e) < num_edges(), "bad edge {}", e);
  Edge& edge = edge_pool_[e];
  RELEASE_ASSERT(edge.target().kind == Edge::kUnexpanded, "edge {} already resolved", e);

  Target target;
  vertex_index_t existing = find_vertex(next_state);
  if (existing == kNullIndex) {
    target = Target{Edge::kExpanded, create_vertex(next_state)};
  } else if (existing == edge.source || is_reachable(existing, edge.source)) {
    target = Target{Edge::kCycle, existing};
  } else {
    target = Target{Edge::kExpanded, existing};
  }
  if (created) *created = (existing == kNullIndex);

  link_parent(target.vertex, e);
  bool resolved = edge.resolve(target);
  RELEASE_ASSERT(resolved, "edge {} resolved concurrently", e);
  return target;
}

template <core::concepts::Game Game>
bool SearchGraph<Game>::expand_vertex(vertex_index_t v) {
  Vertex& vertex = vertex_pool_[v];
  if (vertex.is_expanded()) return false;

  if (!vertex.is_terminal()) {
    std::unordered_set<State> next_states;
    const State state = vertex.state;
    Rules::for_each_action(state, [&](const Action& action) {
      State next_state = state;
      Rules::apply(next_state, action);
      if (next_states.insert(next_state).second) {
        append_child(v, action);
      }
      return core::kContinue;
    });
  }

  bool was_expanded = vertex.expanded.exchange(true, std::memory_order_acq_rel);
  RELEASE_ASSERT(!was_expanded, "vertex {} expanded concurrently", v);
  return true;
}

template <core::concepts::Game Game>
bool SearchGraph<Game>::is_reachable(vertex_index_t from, vertex_index_t to) const {
  if (from == to) return true;

  boost::dynamic_bitset<> visited(num_vertices());
  std::vector<vertex_index_t> stack = {from};
  visited[from] = true;

  while (!stack.empty()) {
    vertex_index_t v = stack.back();
    stack.pop_back();

    for (edge_index_t e = vertex(v).first_child.load(std::memory_order_acquire); e != kNullIndex;
         e = edge(e).next_sibling.load(std::memory_order_acquire)) {
      Target t = edge(e).target();
      if (t.kind != Edge::kExpanded) continue;
      if (t.vertex == to) return true;
      if (visited[t.vertex]) continue;
      visited[t.vertex] = true;
      stack.push_back(t.vertex);
    }
  }
  return false;
}

template <core::concepts::Game Game>
void SearchGraph<Game>::prune(std::vector<vertex_index_t>& roots) {
  Defragmenter defragmenter(this);
  defragmenter.scan(roots);
  defragmenter.prepare();
  defragmenter.defrag();
  for (vertex_index_t& root : roots) {
    defragmenter.remap(root);
  }
}

template <core::concepts::Game Game>
void SearchGraph<Game>::detach_unreachable(vertex_index_t root) {
  for (vertex_index_t v = 0; v < (vertex_index_t)num_vertices(); ++v) {
    vertex(v).detached.store(true, std::memory_order_relaxed);
  }
  reattach(root);
}

template <core::concepts::Game Game>
void SearchGraph<Game>::reattach(vertex_index_t v) {
  if (!vertex(v).is_detached()) return;
  vertex(v).detached.store(false, std::memory_order_release);

  std::vector<vertex_index_t> queue = {v};
  for (size_t i = 0; i < queue.size(); ++i) {
    for_each_child(queue[i], [&](edge_index_t e) {
      Target t = edge(e).target();
      if (t.kind == Edge::kUnexpanded) return;
      Vertex& child = vertex(t.vertex);
      if (!child.is_detached()) return;
      child.detached.store(false, std::memory_order_release);
      queue.push_back(t.vertex);
    });
  }
}

template <core::concepts::Game Game>
void SearchGraph<Game>::clear() {
  map_.clear();
  edge_pool_.clear();
  vertex_pool_.clear();
}

template <core::concepts::Game Game>
template <typename F>
void SearchGraph<Game>::for_each_child(vertex_index_t v, F&& f) const {
  for (edge_index_t e = vertex(v).first_child.load(std::memory_order_acquire); e != kNullIndex;
       e = edge(e).next_sibling.load(std::memory_order_acquire)) {
    f(e);
  }
}

template <core::concepts::Game Game>
template <typename F>
void SearchGraph<Game>::for_each_parent(vertex_index_t v, F&& f) const {
  for (edge_index_t e = vertex(v).first_parent.load(std::memory_order_acquire); e != kNullIndex;
       e = edge(e).next_parent.load(std::memory_order_acquire)) {
    f(e);
  }
}

template <core::concepts::Game Game>
std::vector<edge_index_t> SearchGraph<Game>::children(vertex_index_t v) const {
  std::vector<edge_index_t> out;
  for_each_child(v, [&](edge_index_t e) { out.push_back(e); });
  return out;
}

template <core::concepts::Game Game>
std::vector<edge_index_t> SearchGraph<Game>::parents(vertex_index_t v) const {
  std::vector<edge_index_t> out;
  for_each_parent(v, [&](edge_index_t e) { out.push_back(e); });
  return out;
}

template <core::concepts::Game Game>
vertex_index_t SearchGraph<Game>::create_vertex(const State& state) {
  vertex_index_t v = vertex_pool_.alloc(1);
  Vertex& vertex = vertex_pool_[v];
  vertex.state = state;
  vertex.terminal_payoff = Rules::payoff_of(state);
  vertex.active_player = Rules::get_current_player(state);

  bool inserted = map_.emplace(state, v).second;
  RELEASE_ASSERT(inserted, "duplicate vertex for state");
  return v;
}

template <core::concepts::Game Game>
void SearchGraph<Game>::link_child(vertex_index_t v, edge_index_t e) {
  Vertex& vertex = vertex_pool_[v];
  if (vertex.last_child == kNullIndex) {
    vertex.first_child.store(e, std::memory_order_release);
  } else {
    edge_pool_[vertex.last_child].next_sibling.store(e, std::memory_order_release);
  }
  vertex.last_child = e;
  vertex.num_children.fetch_add(1, std::memory_order_release);
}

template <core::concepts::Game Game>
void SearchGraph<Game>::link_parent(vertex_index_t v, edge_index_t e) {
  Vertex& vertex = vertex_pool_[v];
  if (vertex.last_parent == kNullIndex) {
    vertex.first_parent.store(e, std::memory_order_release);
  } else {
    edge_pool_[vertex.last_parent].next_parent.store(e, std::memory_order_release);
  }
  vertex.last_parent = e;
  vertex.num_parents.fetch_add(1, std::memory_order_release);
}

}  // namespace mcgs
