#include "mcgs/Algorithms.hpp"

#include "mcgs/Constants.hpp"
#include "mcgs/UcbSelector.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <mutex>
#include <optional>
#include <shared_mutex>

namespace mcgs {

template <mcgs::concepts::Traits Traits>
typename Algorithms<Traits>::pass_outcome_t Algorithms<Traits>::iterate(
  GeneralContext& general_context, SearchContext& context) {
  context.start_pass();
  pass_outcome_t outcome = kRootTerminal;

  try {
    RolloutResult rollout_result = rollout(general_context, context);

    switch (rollout_result.kind) {
      case RolloutResult::kRootTerminal: {
        outcome = kRootTerminal;
        break;
      }
      case RolloutResult::kKnownPayoff: {
        const Vertex& vertex = general_context.graph.vertex(rollout_result.vertex);
        auto payoff = vertex.known_payoff();
        RELEASE_ASSERT(payoff.has_value(), "vertex {} lost its known payoff",
                       rollout_result.vertex);
        backprop(general_context, context, rollout_result.edge, *payoff);
        outcome = kBackpropagated;
        break;
      }
      case RolloutResult::kUnexpandedEdge: {
        ExpansionResult expansion = expand(general_context, context, rollout_result.edge);
        if (expansion.kind == ExpansionResult::kCollision) {
          outcome = kCollided;
        } else if (expansion.kind != ExpansionResult::kNewVertex) {
          if (expansion.seed.weight > 0) {
            backprop(general_context, context, rollout_result.edge, expansion.seed, false);
          }
          outcome = kSeeded;
        } else {
          vertex_index_t v = expansion.target.vertex;
          const Vertex& vertex = general_context.graph.vertex(v);
          Payoff payoff =
            vertex.is_terminal() ? *vertex.terminal_payoff : simulate(general_context, context, v);
          backprop(general_context, context, rollout_result.edge, payoff);
          outcome = kExpanded;
        }
        break;
      }
    }
  } catch (const CycleError& error) {
    penalize_cycle(general_context, context, error);
    outcome = kCycleDetected;
  } catch (...) {
    end_pass(general_context, context);
    throw;
  }

  end_pass(general_context, context);

  RoundStats& stats = context.stats;
  stats.iterations++;
  switch (outcome) {
    case kExpanded:
      stats.expansions++;
      break;
    case kSeeded:
      stats.transpositions++;
      break;
    case kCycleDetected:
      stats.cycles++;
      break;
    case kCollided:
      stats.collisions++;
      break;
    default:
      break;
  }
  return outcome;
}

template <mcgs::concepts::Traits Traits>
typename Algorithms<Traits>::RolloutResult Algorithms<Traits>::rollout(
  GeneralContext& general_context, SearchContext& context) {
  SearchGraph& graph = general_context.graph;
  const worker_id_t w = context.worker_id;

  vertex_index_t v = context.root;
  if (graph.vertex(v).is_terminal()) {
    return RolloutResult{RolloutResult::kRootTerminal, v};
  }

  while (true) {
    Vertex& vertex = graph.vertex(v);

    // The root is searched even when proven, so that its child statistics keep accumulating.
    if (v != context.root && vertex.known_payoff().has_value()) {
      return RolloutResult{RolloutResult::kKnownPayoff, v, context.search_path.back()};
    }

    if (!vertex.is_expanded()) {
      std::unique_lock lock(graph.mutex());
      graph.expand_vertex(v);
    }

    if (vertex.num_children.load(std::memory_order_acquire) == 0) {
      throw SearchError(SearchError::kNoTerminalPayoff, "no legal actions and no payoff: {}",
                        IO::compact_state_repr(vertex.state));
    }

    edge_index_t e = general_context.rollout_selector.select(graph, v, context.prng);
    Edge& edge = graph.edge(e);

    if (edge.traversals.mark_rollout(w)) {
      if (kEnableSearchDebug) {
        LOG_INFO("{:>{}}rollout: cycle at {} path={}", "", context.log_prefix_n(),
                 IO::action_to_str(edge.action), context.search_path_str(graph));
      }
      throw CycleError(context.search_path, e);
    }
    context.touched_edges.push_back(e);
    context.search_path.push_back(e);

    Target target = edge.target();
    if (target.kind == Edge::kUnexpanded) {
      if (kEnableSearchDebug) {
        LOG_INFO("{:>{}}rollout: {}", "", context.log_prefix_n(), context.search_path_str(graph));
      }
      return RolloutResult{RolloutResult::kUnexpandedEdge, v, e};
    }
    v = target.vertex;
  }
}

template <mcgs::concepts::Traits Traits>
typename Algorithms<Traits>::ExpansionResult Algorithms<Traits>::expand(
  GeneralContext& general_context, SearchContext& context, edge_index_t e) {
  SearchGraph& graph = general_context.graph;
  Edge& edge = graph.edge(e);

  // Vertex::state is immutable, so the next state can be computed outside the lock.
  State next_state = graph.vertex(edge.source).state;
  Rules::apply(next_state, edge.action);

  std::unique_lock lock(graph.mutex());
  Target target = edge.target();
  if (target.kind != Edge::kUnexpanded) {
    return ExpansionResult{ExpansionResult::kCollision, target};
  }

  bool created = false;
  target = graph.resolve_edge(e, next_state, &created);
  graph.expand_vertex(target.vertex);  // no-op unless created
  graph.reattach(target.vertex);       // a retained subgraph can rejoin the search
  lock.unlock();

  if (kEnableSearchDebug) {
    LOG_INFO("{:>{}}expand: {} -> {} kind={} created={}", "", context.log_prefix_n(),
             IO::action_to_str(edge.action), target.vertex, int(target.kind), created);
  }

  if (created) {
    return ExpansionResult{ExpansionResult::kNewVertex, target};
  }

  Payoff seed = seed_of(general_context, target.vertex);
  if (kEnableSearchDebug) {
    LOG_INFO("{:>{}}seed: edge={} target={} seed={}", "", context.log_prefix_n(), e, target.vertex,
             seed.to_str());
  }

  if (target.kind == Edge::kCycle) {
    return ExpansionResult{ExpansionResult::kCycle, target, seed};
  }
  return ExpansionResult{ExpansionResult::kTransposition, target, seed};
}

template <mcgs::concepts::Traits Traits>
typename Algorithms<Traits>::Payoff Algorithms<Traits>::simulate(GeneralContext& general_context,
                                                                 SearchContext& context,
                                                                 vertex_index_t v) {
  const State& state = general_context.graph.vertex(v).state;

  Payoff total = Payoff::zero();
  for (int i = 0; i < general_context.params.simulation_count; ++i) {
    total += general_context.simulator.simulate(state, context.prng);
  }
  context.stats.simulations += general_context.params.simulation_count;

  if (kEnableSearchDebug) {
    LOG_INFO("{:>{}}simulate: {} -> {}", "", context.log_prefix_n(), IO::compact_state_repr(state),
             total.to_str());
  }
  return total;
}

template <mcgs::concepts::Traits Traits>
void Algorithms<Traits>::backprop(GeneralContext& general_context, SearchContext& context,
                                  edge_index_t leaf_edge, const Payoff& payoff,
                                  bool credit_target) {
  SearchGraph& graph = general_context.graph;

  collect_backprop_frontier(general_context, context, leaf_edge, credit_target);

  for (edge_index_t e : context.backprop_edges) {
    graph.edge(e).stats.increment(payoff);
  }
  for (vertex_index_t v : context.backprop_vertices) {
    graph.vertex(v).stats.increment(payoff);
  }

  if (kEnableSearchDebug) {
    LOG_INFO("{:>{}}backprop: {} edges={} vertices={}", "", context.log_prefix_n(),
             payoff.to_str(), context.backprop_edges.size(), context.backprop_vertices.size());
  }

  // backprop_vertices is ordered leaf-first, so proven payoffs flow upward within this pass.
  for (vertex_index_t v : context.backprop_vertices) {
    refine(general_context, context, v);
  }
}

template <mcgs::concepts::Traits Traits>
void Algorithms<Traits>::penalize_cycle(GeneralContext& general_context, SearchContext& context,
                                        const CycleError& error) {
  // The last edge of the path led back into the loop. Once visited, a cycle edge is masked.
  const auto& path = error.path();
  edge_index_t closing_edge = path.empty() ? error.repeated_edge() : path.back();

  Payoff penalty = Payoff::zero();
  penalty.weight = 1;
  general_context.graph.edge(closing_edge).stats.increment(penalty);

  LOG_DEBUG("{:>{}}discarded pass: {}", "", context.log_prefix_n(), error.what());
}

template <mcgs::concepts::Traits Traits>
void Algorithms<Traits>::end_pass(GeneralContext& general_context, SearchContext& context) {
  for (edge_index_t e : context.touched_edges) {
    general_context.graph.edge(e).traversals.clear(context.worker_id);
  }
  context.touched_edges.clear();
}

template <mcgs::concepts::Traits Traits>
typename Algorithms<Traits>::SearchResults Algorithms<Traits>::to_results(
  const GeneralContext& general_context, vertex_index_t root, epoch_t epoch) {
  const SearchGraph& graph = general_context.graph;
  const Vertex& vertex = graph.vertex(root);

  SearchResults results;
  results.epoch = epoch;
  results.root_visits = vertex.stats.visits();
  results.active_player = vertex.active_player;

  if (vertex.num_children.load(std::memory_order_acquire) == 0) return results;

  UcbSelector<Game> selector(graph, root, general_context.params.explore_bias);
  for (int i = 0; i < selector.num_children(); ++i) {
    edge_index_t e = selector.edge(i);
    const Edge& edge = graph.edge(e);
    results.actions.push_back({edge.action, e, edge.stats.as_payoff(), selector.result(i)});
  }
  return results;
}

template <mcgs::concepts::Traits Traits>
typename Algorithms<Traits>::Payoff Algorithms<Traits>::seed_of(
  const GeneralContext& general_context, vertex_index_t target) {
  const SearchGraph& graph = general_context.graph;
  const Vertex& vertex = graph.vertex(target);

  auto known = vertex.known_payoff();
  if (known.has_value()) return *known;

  Payoff seed = Payoff::zero();
  graph.for_each_child(target, [&](edge_index_t c) { seed += graph.edge(c).stats.as_payoff(); });
  return seed;
}

template <mcgs::concepts::Traits Traits>
void Algorithms<Traits>::collect_backprop_frontier(GeneralContext& general_context,
                                                   SearchContext& context,
                                                   edge_index_t leaf_edge,
                                                   bool credit_target) {
  const SearchGraph& graph = general_context.graph;
  const worker_id_t w = context.worker_id;

  context.backprop_edges.clear();
  context.backprop_vertices.clear();
  context.visited_vertices.reset();
  context.visited_vertices.resize(graph.num_vertices());

  const Edge& leaf = graph.edge(leaf_edge);
  Target leaf_target = leaf.target();
  RELEASE_ASSERT(leaf_target.kind != Edge::kUnexpanded, "backprop from unexpanded edge {}",
                 leaf_edge);

  // The leaf edge is already on the search path, and hence in touched_edges.
  general_context.graph.edge(leaf_edge).traversals.mark_backprop(w);
  context.backprop_edges.push_back(leaf_edge);

  // A cycle edge leads back to an ancestor, whose statistics are reached through the walk below.
  size_t walk_start = 0;
  if (credit_target && leaf_target.kind == Edge::kExpanded) {
    visit_vertex(context, leaf_target.vertex);
    walk_start = 1;
  }
  visit_vertex(context, leaf.source);

  // backprop_vertices doubles as the BFS queue. The leaf target is not walked. The walk stops at
  // the root and at detached vertices, which are positions from earlier moves.
  for (size_t i = walk_start; i < context.backprop_vertices.size(); ++i) {
    vertex_index_t v = context.backprop_vertices[i];
    if (v == context.root) continue;

    graph.for_each_parent(v, [&](edge_index_t p) {
      const Edge& parent = graph.edge(p);
      if (parent.target().kind != Edge::kExpanded) return;  // cycle edges absorb nothing
      if (parent.traversals.backprop_marked(w)) return;
      if (graph.vertex(parent.source).is_detached()) return;
      if (!general_context.backprop_selector.include(graph, p)) return;

      general_context.graph.edge(p).traversals.mark_backprop(w);
      context.touched_edges.push_back(p);
      context.backprop_edges.push_back(p);
      visit_vertex(context, parent.source);
    });
  }
}

template <mcgs::concepts::Traits Traits>
void Algorithms<Traits>::visit_vertex(SearchContext& context, vertex_index_t v) {
  auto& visited = context.visited_vertices;
  if (uint64_t(v) >= visited.size()) {
    visited.resize(v + 1);  // created by another worker after the scan started
  }
  if (visited[v]) return;
  visited[v] = true;
  context.backprop_vertices.push_back(v);
}

/*
 * A vertex all of whose children lead to known payoffs is proven: its payoff is the child payoff
 * that is best for the player to move. A vertex all of whose children are cyclic is cyclic.
 */
template <mcgs::concepts::Traits Traits>
void Algorithms<Traits>::refine(GeneralContext& general_context, SearchContext& context,
                                vertex_index_t v) {
  SearchGraph& graph = general_context.graph;
  Vertex& vertex = graph.vertex(v);
  if (vertex.is_terminal() || !vertex.is_expanded()) return;

  int num_children = 0;
  bool all_known = true;
  bool all_cyclic = true;
  std::optional<Payoff> best;
  const core::player_index_t player = vertex.active_player;

  graph.for_each_child(v, [&](edge_index_t e) {
    ++num_children;
    Target target = graph.edge(e).target();
    if (target.kind == Edge::kUnexpanded) {
      all_known = false;
      all_cyclic = false;
      return;
    }
    const Vertex& child = graph.vertex(target.vertex);
    if (target.kind != Edge::kCycle && !child.is_cyclic()) all_cyclic = false;
    if (target.kind == Edge::kCycle) {
      all_known = false;
      return;
    }
    auto known = child.known_payoff();
    if (!known.has_value()) {
      all_known = false;
      return;
    }
    if (!best.has_value() || known->score(player) > best->score(player)) {
      best = known;
    }
  });

  if (num_children == 0) return;

  if (all_known && !vertex.is_proven() && vertex.set_proven(*best)) {
    if (kEnableSearchDebug) {
      LOG_INFO("{:>{}}proven: {} -> {}", "", context.log_prefix_n(),
               IO::compact_state_repr(vertex.state), best->to_str());
    }
  }
  if (all_cyclic && !vertex.is_cyclic()) {
    vertex.cyclic.store(true, std::memory_order_release);
  }
}

}  // namespace mcgs
