#include "core/BasicTypes.hpp"
#include "core/Payoff.hpp"
#include "core/Statistics.hpp"
#include "core/concepts/Game.hpp"
#include "games/tictactoe/Game.hpp"
#include "mcgs/Algorithms.hpp"
#include "mcgs/BackpropSelectors.hpp"
#include "mcgs/GeneralContext.hpp"
#include "mcgs/Manager.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchContext.hpp"
#include "mcgs/SearchError.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/SearchResults.hpp"
#include "mcgs/Traits.hpp"
#include "mcgs/Traversals.hpp"
#include "mcgs/UcbSelector.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/*
 * A game defined by an explicit table. States are node ids, and an action is the id of the state
 * it leads to. A node is terminal iff it has an entry in payoffs.
 */
struct GraphGame {
  struct Constants {
    static constexpr const char* kGameName = "graph";
    static constexpr int kNumPlayers = 2;
  };

  struct State {
    auto operator<=>(const State& other) const = default;
    int id = 0;
  };

  using Action = int;
  using Payoff = core::Payoff<2>;
  using Statistics = core::Statistics<2>;

  struct Table {
    std::vector<std::vector<int>> successors;
    std::vector<core::player_index_t> players;
    std::map<int, Payoff::score_array_t> payoffs;
  };

  inline static const Table* table = nullptr;

  struct Rules {
    static core::player_index_t get_current_player(const State& state) {
      return table->players[state.id];
    }

    template <typename F>
    static void for_each_action(const State& state, F&& f) {
      for (int next : table->successors[state.id]) {
        if (f(next) == core::kBreak) return;
      }
    }

    static void apply(State& state, Action action) { state.id = action; }

    static std::optional<Payoff> payoff_of(const State& state) {
      auto it = table->payoffs.find(state.id);
      if (it == table->payoffs.end()) return std::nullopt;
      return Payoff::outcome(it->second);
    }
  };

  struct IO {
    static std::string action_to_str(Action action) { return std::to_string(action); }
    static std::string compact_state_repr(const State& state) { return std::to_string(state.id); }
  };
};

namespace std {

template <>
struct hash<GraphGame::State> {
  size_t operator()(const GraphGame::State& s) const { return std::hash<int>{}(s.id); }
};

}  // namespace std

static_assert(core::concepts::Game<GraphGame>);

using Payoff = GraphGame::Payoff;
using Statistics = GraphGame::Statistics;
using State = GraphGame::State;
using Graph = mcgs::SearchGraph<GraphGame>;
using Edge = Graph::Edge;
using Target = Graph::Target;
using mcgs::edge_index_t;
using mcgs::kNullIndex;
using mcgs::vertex_index_t;

// 0 -> {1, 2}, 1 -> {3}, 2 -> {3}, 3 -> {4}, 4 terminal
const GraphGame::Table kDiamond = {
  {{1, 2}, {3}, {3}, {4}, {}},
  {0, 1, 1, 0, 1},
  {{4, {2, 0}}},
};

// 0 -> {1}, 1 -> {0, 2}, 2 terminal
const GraphGame::Table kLoop = {
  {{1}, {0, 2}, {}},
  {0, 1, 0},
  {{2, {1, 1}}},
};

// 0 -> {1}, 1 -> {0}: no way out
const GraphGame::Table kClosedLoop = {
  {{1}, {0}},
  {0, 1},
  {},
};

// 0 -> {1, 2}, 1 and 2 terminal: 1 wins for player 0, 2 loses for player 0
const GraphGame::Table kOnePly = {
  {{1, 2}, {}, {}},
  {0, 1, 1},
  {{1, {2, 0}}, {2, {0, 2}}},
};

// 0 -> 1 -> 2 -> 3, 3 terminal
const GraphGame::Table kForcedLine = {
  {{1}, {2}, {3}, {}},
  {0, 1, 0, 1},
  {{3, {2, 0}}},
};

// 0 -> 1, 1 has no actions and no payoff
const GraphGame::Table kBrokenGame = {
  {{1}, {}},
  {0, 1},
  {},
};

// 0 -> {1, 1, 2}: two actions lead to the same state
const GraphGame::Table kDuplicateActions = {
  {{1, 1, 2}, {}, {}},
  {0, 1, 1},
  {{1, {1, 1}}, {2, {1, 1}}},
};

Target resolve(Graph& graph, edge_index_t e, bool* created = nullptr) {
  State next_state = graph.vertex(graph.edge(e).source).state;
  GraphGame::Rules::apply(next_state, graph.edge(e).action);
  return graph.resolve_edge(e, next_state, created);
}

// Resolves every edge reachable from state 0 and expands every vertex. Returns the root.
vertex_index_t build_graph(Graph& graph) {
  vertex_index_t root = graph.find_or_create_root(State{0});
  graph.expand_vertex(root);

  std::vector<vertex_index_t> queue = {root};
  for (size_t i = 0; i < queue.size(); ++i) {
    for (edge_index_t e : graph.children(queue[i])) {
      bool created = false;
      Target t = resolve(graph, e, &created);
      if (created) {
        graph.expand_vertex(t.vertex);
        queue.push_back(t.vertex);
      }
    }
  }
  return root;
}

edge_index_t find_edge(const Graph& graph, int from, int to) {
  vertex_index_t v = graph.find_vertex(State{from});
  for (edge_index_t e : graph.children(v)) {
    if (graph.edge(e).action == to) return e;
  }
  return kNullIndex;
}

mcgs::ManagerParams make_params(int num_iterations, int num_threads = 1) {
  mcgs::ManagerParams params;
  params.num_iterations = num_iterations;
  params.num_search_threads = num_threads;
  return params;
}

TEST(Payoff, accumulate) {
  Payoff a = Payoff::outcome({2, 0});
  Payoff b = Payoff::outcome({1, 1});
  a += b;
  EXPECT_EQ(a.weight, 2u);
  EXPECT_EQ(a.score(0), 3u);
  EXPECT_EQ(a.score(1), 1u);
  EXPECT_EQ(a + Payoff::zero(), a);
  EXPECT_EQ(a.to_str(), "[3, 1]@2");
}

TEST(Statistics, increment_and_store) {
  Statistics stats;
  EXPECT_EQ(stats.visits(), 0u);

  stats.increment(Payoff::outcome({2, 0}));
  stats.increment(Payoff::outcome({1, 1}));
  EXPECT_EQ(stats.visits(), 2u);
  EXPECT_EQ(stats.score(0), 3u);
  EXPECT_EQ(stats.score(1), 1u);
  EXPECT_EQ(stats.as_payoff(), Payoff::outcome({2, 0}) + Payoff::outcome({1, 1}));

  stats.store(Payoff::outcome({0, 2}));
  EXPECT_EQ(stats.visits(), 1u);
  EXPECT_EQ(stats.score(1), 2u);

  Statistics copy(stats);
  EXPECT_EQ(copy.as_payoff(), stats.as_payoff());
}

TEST(Statistics, saturation) {
  Statistics stats;
  Payoff big;
  big.weight = Statistics::kVisitsMax - 1;
  big.scores = {uint32_t(Statistics::kScoreMax - 1), 0};
  stats.increment(big);
  stats.increment(Payoff::outcome({5, 5}));
  stats.increment(Payoff::outcome({5, 5}));

  EXPECT_EQ(stats.visits(), Statistics::kVisitsMax);
  EXPECT_EQ(stats.score(0), Statistics::kScoreMax);
  EXPECT_EQ(stats.score(1), 10u);
}

TEST(Traversals, lanes_are_exclusive) {
  mcgs::Traversals traversals;
  EXPECT_FALSE(traversals.mark_rollout(3));
  EXPECT_TRUE(traversals.mark_rollout(3));
  EXPECT_FALSE(traversals.mark_rollout(4));  // other workers are independent

  EXPECT_FALSE(traversals.mark_backprop(3));
  EXPECT_FALSE(traversals.rollout_marked(3));
  EXPECT_TRUE(traversals.backprop_marked(3));
  EXPECT_TRUE(traversals.rollout_marked(4));

  EXPECT_FALSE(traversals.mark_rollout(3));
  EXPECT_FALSE(traversals.backprop_marked(3));

  traversals.clear(3);
  EXPECT_FALSE(traversals.rollout_marked(3));
  EXPECT_FALSE(traversals.mark_rollout(3));
}

TEST(Edge, target_resolves_once) {
  Edge edge;
  EXPECT_EQ(edge.target().kind, Edge::kUnexpanded);

  EXPECT_TRUE(edge.resolve(Target{Edge::kExpanded, 7}));
  EXPECT_EQ(edge.target(), (Target{Edge::kExpanded, 7}));

  EXPECT_FALSE(edge.resolve(Target{Edge::kCycle, 3}));
  EXPECT_EQ(edge.target(), (Target{Edge::kExpanded, 7}));
}

TEST(SearchGraph, deduplication) {
  GraphGame::table = &kDiamond;
  Graph graph;
  vertex_index_t root = build_graph(graph);

  EXPECT_EQ(graph.num_vertices(), 5u);
  EXPECT_EQ(graph.num_edges(), 5u);
  EXPECT_EQ(graph.find_or_create_root(State{0}), root);

  vertex_index_t v3 = graph.find_vertex(State{3});
  ASSERT_NE(v3, kNullIndex);
  EXPECT_EQ(graph.parents(v3).size(), 2u);
  EXPECT_EQ(graph.edge(find_edge(graph, 1, 3)).target(), (Target{Edge::kExpanded, v3}));
  EXPECT_EQ(graph.edge(find_edge(graph, 2, 3)).target(), (Target{Edge::kExpanded, v3}));

  EXPECT_EQ(graph.find_vertex(State{17}), kNullIndex);
}

TEST(SearchGraph, duplicate_actions_share_an_edge) {
  GraphGame::table = &kDuplicateActions;
  Graph graph;
  vertex_index_t root = graph.find_or_create_root(State{0});
  EXPECT_TRUE(graph.expand_vertex(root));
  EXPECT_FALSE(graph.expand_vertex(root));

  EXPECT_EQ(graph.children(root).size(), 2u);
  EXPECT_TRUE(graph.vertex(root).is_expanded());
}

TEST(SearchGraph, cycle_classification) {
  GraphGame::table = &kLoop;
  Graph graph;
  build_graph(graph);

  vertex_index_t v0 = graph.find_vertex(State{0});
  Target back = graph.edge(find_edge(graph, 1, 0)).target();
  EXPECT_EQ(back, (Target{Edge::kCycle, v0}));
  EXPECT_EQ(graph.edge(find_edge(graph, 1, 2)).target().kind, Edge::kExpanded);

  EXPECT_TRUE(graph.is_reachable(v0, graph.find_vertex(State{2})));
  EXPECT_FALSE(graph.is_reachable(graph.find_vertex(State{1}), v0));  // cycle edges don't count
}

TEST(SearchGraph, prune) {
  GraphGame::table = &kDiamond;
  Graph graph;
  build_graph(graph);

  std::vector<vertex_index_t> roots = {graph.find_vertex(State{2})};
  graph.prune(roots);

  EXPECT_EQ(graph.num_vertices(), 3u);  // 2, 3, 4
  EXPECT_EQ(graph.num_edges(), 2u);
  EXPECT_EQ(graph.find_vertex(State{0}), kNullIndex);
  EXPECT_EQ(graph.find_vertex(State{1}), kNullIndex);
  EXPECT_EQ(roots[0], graph.find_vertex(State{2}));
  EXPECT_EQ(graph.vertex(roots[0]).state, State{2});

  vertex_index_t v3 = graph.find_vertex(State{3});
  ASSERT_NE(v3, kNullIndex);
  EXPECT_EQ(graph.parents(v3).size(), 1u);

  for (edge_index_t e = 0; e < (edge_index_t)graph.num_edges(); ++e) {
    const Edge& edge = graph.edge(e);
    Target t = edge.target();
    ASSERT_EQ(t.kind, Edge::kExpanded);
    State next = graph.vertex(edge.source).state;
    GraphGame::Rules::apply(next, edge.action);
    EXPECT_EQ(graph.vertex(t.vertex).state, next);
  }
}

TEST(SearchGraph, detach_unreachable) {
  GraphGame::table = &kDiamond;
  Graph graph;
  build_graph(graph);

  graph.detach_unreachable(graph.find_vertex(State{2}));
  for (int s : {0, 1}) {
    EXPECT_TRUE(graph.vertex(graph.find_vertex(State{s})).is_detached()) << s;
  }
  for (int s : {2, 3, 4}) {
    EXPECT_FALSE(graph.vertex(graph.find_vertex(State{s})).is_detached()) << s;
  }

  graph.reattach(graph.find_vertex(State{1}));
  EXPECT_FALSE(graph.vertex(graph.find_vertex(State{1})).is_detached());
  EXPECT_TRUE(graph.vertex(graph.find_vertex(State{0})).is_detached());

  graph.detach_unreachable(graph.find_vertex(State{0}));
  for (vertex_index_t v = 0; v < (vertex_index_t)graph.num_vertices(); ++v) {
    EXPECT_FALSE(graph.vertex(v).is_detached()) << v;
  }
}

TEST(SearchGraph, prune_keeps_cycle_targets_and_child_order) {
  GraphGame::table = &kLoop;
  Graph graph;
  build_graph(graph);

  std::vector<vertex_index_t> roots = {graph.find_vertex(State{1})};
  graph.prune(roots);

  // 0 is reachable from 1 through the cycle edge, so everything survives
  EXPECT_EQ(graph.num_vertices(), 3u);
  std::vector<edge_index_t> children = graph.children(roots[0]);
  ASSERT_EQ(children.size(), 2u);
  EXPECT_EQ(graph.edge(children[0]).action, 0);
  EXPECT_EQ(graph.edge(children[1]).action, 2);
  EXPECT_EQ(graph.edge(children[0]).target().kind, Edge::kCycle);
}

TEST(UcbSelector, cold_start) {
  GraphGame::table = &kOnePly;
  Graph graph;
  vertex_index_t root = build_graph(graph);
  graph.edge(find_edge(graph, 0, 1)).stats.store(Payoff{100, {200, 0}});

  std::mt19937 prng(1);
  for (double bias : {0.0, 0.64, 100.0}) {
    mcgs::UcbSelector<GraphGame> selector(graph, root, bias);
    for (int i = 0; i < 20; ++i) {
      EXPECT_EQ(selector.edge(selector.select(prng)), find_edge(graph, 0, 2));
    }
    EXPECT_TRUE(selector.is_best_child(find_edge(graph, 0, 2)));
    EXPECT_FALSE(selector.is_best_child(find_edge(graph, 0, 1)));
  }
}

TEST(UcbSelector, tie_fairness) {
  const GraphGame::Table table = {
    {{1, 2, 3}, {}, {}, {}},
    {0, 1, 1, 1},
    {{1, {1, 1}}, {2, {1, 1}}, {3, {1, 1}}},
  };
  GraphGame::table = &table;
  Graph graph;
  vertex_index_t root = build_graph(graph);
  for (edge_index_t e : graph.children(root)) {
    graph.edge(e).stats.store(Payoff{4, {2, 6}});
  }

  mcgs::UcbSelector<GraphGame> selector(graph, root, 0.64);
  std::mt19937 prng(7);
  std::array<int, 3> counts = {};
  constexpr int N = 30000;
  for (int i = 0; i < N; ++i) {
    counts[selector.select(prng)]++;
  }
  for (int c : counts) {
    EXPECT_NEAR(c * 1.0 / N, 1.0 / 3, 0.02);
  }
  for (edge_index_t e : graph.children(root)) {
    EXPECT_TRUE(selector.is_best_child(e));
  }
}

TEST(UcbSelector, scores) {
  GraphGame::table = &kOnePly;
  Graph graph;
  vertex_index_t root = build_graph(graph);
  graph.edge(find_edge(graph, 0, 1)).stats.store(Payoff{3, {6, 0}});
  graph.edge(find_edge(graph, 0, 2)).stats.store(Payoff{1, {0, 2}});

  mcgs::UcbSelector<GraphGame> selector(graph, root, 0.5);
  double expected0 = 2.0 + 0.5 * std::sqrt(std::log(4.0) / 3);
  double expected1 = 0.0 + 0.5 * std::sqrt(std::log(4.0) / 1);
  EXPECT_NEAR(selector.UCB(0), expected0, 1e-9);
  EXPECT_NEAR(selector.UCB(1), expected1, 1e-9);

  mcgs::UcbResult result = selector.result(0);
  EXPECT_EQ(result.kind, mcgs::UcbResult::kValue);
  EXPECT_NEAR(result.value, expected0, 1e-9);
}

TEST(UcbSelector, nan_is_a_selector_error) {
  GraphGame::table = &kOnePly;
  Graph graph;
  vertex_index_t root = build_graph(graph);
  for (edge_index_t e : graph.children(root)) {
    graph.edge(e).stats.store(Payoff{1, {1, 1}});
  }

  mcgs::UcbSelector<GraphGame> selector(graph, root, std::numeric_limits<double>::quiet_NaN());
  std::mt19937 prng(1);
  try {
    selector.select(prng);
    FAIL() << "select() did not throw";
  } catch (const mcgs::SearchError& e) {
    EXPECT_EQ(e.kind(), mcgs::SearchError::kSelector);
  }
  EXPECT_EQ(selector.result(0).kind, mcgs::UcbResult::kInvalid);
}

TEST(UcbSelector, unvisited_cycle_edge_is_selected) {
  GraphGame::table = &kLoop;
  Graph graph;
  build_graph(graph);
  vertex_index_t v1 = graph.find_vertex(State{1});
  edge_index_t e10 = find_edge(graph, 1, 0);
  edge_index_t e12 = find_edge(graph, 1, 2);
  ASSERT_EQ(graph.edge(e10).target().kind, Edge::kCycle);

  // Zero visits win over any visited sibling, cyclic or not.
  graph.edge(e12).stats.store(Payoff{1000, {0, 0}});
  mcgs::UcbSelector<GraphGame> selector(graph, v1, 100.0);
  EXPECT_EQ(selector.mask(0), 1);
  std::mt19937 prng(3);
  for (int i = 0; i < 1000; ++i) {
    ASSERT_EQ(selector.edge(selector.select(prng)), e10);
  }
  EXPECT_TRUE(selector.is_best_child(e10));
  EXPECT_FALSE(selector.is_best_child(e12));
}

TEST(UcbSelector, visited_cycle_edge_is_masked) {
  GraphGame::table = &kLoop;
  Graph graph;
  build_graph(graph);
  vertex_index_t v1 = graph.find_vertex(State{1});
  edge_index_t e10 = find_edge(graph, 1, 0);
  edge_index_t e12 = find_edge(graph, 1, 2);

  // The cycle edge scores far higher, but once visited it is never picked.
  graph.edge(e10).stats.store(Payoff{1, {0, 2}});
  graph.edge(e12).stats.store(Payoff{1000, {0, 0}});
  mcgs::UcbSelector<GraphGame> selector(graph, v1, 0.64);
  EXPECT_EQ(selector.mask(0), 0);
  EXPECT_EQ(selector.mask(1), 1);
  std::mt19937 prng(3);
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(selector.edge(selector.select(prng)), e12);
  }
  EXPECT_FALSE(selector.is_best_child(e10));
  EXPECT_TRUE(selector.is_best_child(e12));
}

TEST(UcbSelector, all_cyclic_children_are_unmasked) {
  GraphGame::table = &kClosedLoop;
  Graph graph;
  build_graph(graph);
  graph.edge(find_edge(graph, 1, 0)).stats.store(Payoff{1, {0, 0}});

  mcgs::UcbSelector<GraphGame> selector(graph, graph.find_vertex(State{1}), 0.64);
  ASSERT_EQ(selector.num_children(), 1);
  EXPECT_EQ(selector.mask(0), 1);
}

using GraphTraits = mcgs::Traits<GraphGame>;
using FirstParentTraits =
  mcgs::Traits<GraphGame, mcgs::UcbRolloutSelector<GraphGame>,
               mcgs::FirstParentBackpropSelector<GraphGame>>;

using Algorithms = mcgs::Algorithms<GraphTraits>;
using FirstParentAlgorithms = mcgs::Algorithms<FirstParentTraits>;

template <typename Traits>
struct AlgorithmsHarness {
  AlgorithmsHarness() : general_context(params, graph), context(0, 1) {}

  mcgs::ManagerParams params;
  Graph graph;
  mcgs::GeneralContext<Traits> general_context;
  mcgs::SearchContext<Traits> context;
};

TEST(Algorithms, backprop_updates_every_best_parent) {
  GraphGame::table = &kDiamond;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = build_graph(h.graph);
  h.context.init(root, 1);

  Payoff payoff = Payoff::outcome({2, 0});
  edge_index_t leaf = find_edge(h.graph, 3, 4);
  h.context.search_path = {find_edge(h.graph, 0, 1), find_edge(h.graph, 1, 3), leaf};
  Algorithms::backprop(h.general_context, h.context, leaf, payoff);

  std::vector<std::pair<int, int>> updated_edges = {{3, 4}, {1, 3}, {2, 3}, {0, 1}, {0, 2}};
  for (auto [from, to] : updated_edges) {
    EXPECT_EQ(h.graph.edge(find_edge(h.graph, from, to)).stats.as_payoff(), payoff)
      << from << "->" << to;
  }
  for (int s = 0; s <= 4; ++s) {
    EXPECT_EQ(h.graph.vertex(h.graph.find_vertex(State{s})).stats.visits(), 1u) << s;
  }

  // 4 is terminal, so everything above it is proven with 4's payoff
  EXPECT_TRUE(h.graph.vertex(h.graph.find_vertex(State{3})).is_proven());
  EXPECT_TRUE(h.graph.vertex(root).is_proven());
  EXPECT_EQ(*h.graph.vertex(root).known_payoff(), payoff);
}

TEST(Algorithms, backprop_skips_parents_that_are_not_best) {
  const GraphGame::Table table = {
    {{1, 2}, {3}, {3, 5}, {4}, {}, {}},
    {0, 1, 1, 0, 1, 0},
    {{4, {2, 0}}, {5, {0, 2}}},
  };
  GraphGame::table = &table;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = build_graph(h.graph);
  h.context.init(root, 1);

  // At vertex 2 (player 1 to move), 2->5 is clearly better than 2->3.
  h.graph.edge(find_edge(h.graph, 2, 3)).stats.store(Payoff{1, {2, 0}});
  h.graph.edge(find_edge(h.graph, 2, 5)).stats.store(Payoff{5, {0, 10}});

  Payoff payoff = Payoff::outcome({2, 0});
  Algorithms::backprop(h.general_context, h.context, find_edge(h.graph, 3, 4), payoff);

  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 1, 3)).stats.visits(), 1u);
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 2, 3)).stats.visits(), 1u);  // unchanged
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 0, 1)).stats.visits(), 1u);
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 0, 2)).stats.visits(), 0u);
  EXPECT_EQ(h.graph.vertex(h.graph.find_vertex(State{2})).stats.visits(), 0u);
}

TEST(Algorithms, first_parent_backprop) {
  GraphGame::table = &kDiamond;
  AlgorithmsHarness<FirstParentTraits> h;
  vertex_index_t root = build_graph(h.graph);
  h.context.init(root, 1);

  Payoff payoff = Payoff::outcome({2, 0});
  FirstParentAlgorithms::backprop(h.general_context, h.context, find_edge(h.graph, 3, 4), payoff);

  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 1, 3)).stats.visits(), 1u);
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 2, 3)).stats.visits(), 0u);
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 0, 1)).stats.visits(), 1u);
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 0, 2)).stats.visits(), 0u);
}

TEST(Algorithms, rollout_cycle_is_discarded_and_penalized) {
  GraphGame::table = &kClosedLoop;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = build_graph(h.graph);
  h.context.init(root, 1);

  edge_index_t e01 = find_edge(h.graph, 0, 1);
  edge_index_t e10 = find_edge(h.graph, 1, 0);
  ASSERT_EQ(h.graph.edge(e10).target().kind, Edge::kCycle);

  auto outcome = Algorithms::iterate(h.general_context, h.context);
  EXPECT_EQ(outcome, Algorithms::kCycleDetected);
  EXPECT_EQ(h.context.stats.cycles, 1);

  EXPECT_EQ(h.graph.edge(e01).stats.visits(), 0u);
  EXPECT_EQ(h.graph.edge(e10).stats.as_payoff(), (Payoff{1, {0, 0}}));
  EXPECT_FALSE(h.graph.edge(e01).traversals.rollout_marked(0));
  EXPECT_FALSE(h.graph.edge(e10).traversals.rollout_marked(0));
  EXPECT_TRUE(h.context.touched_edges.empty());
}

TEST(Algorithms, rollout_throws_cycle_error) {
  GraphGame::table = &kClosedLoop;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = build_graph(h.graph);
  h.context.init(root, 1);

  try {
    Algorithms::rollout(h.general_context, h.context);
    FAIL() << "rollout() did not throw";
  } catch (const mcgs::CycleError& e) {
    EXPECT_EQ(e.kind(), mcgs::SearchError::kCycle);
    EXPECT_EQ(e.repeated_edge(), find_edge(h.graph, 0, 1));
    EXPECT_EQ(e.path().size(), 2u);
  }
  Algorithms::end_pass(h.general_context, h.context);
}

TEST(Algorithms, transposition_carries_seed) {
  GraphGame::table = &kDiamond;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = h.graph.find_or_create_root(State{0});
  h.graph.expand_vertex(root);
  h.context.init(root, 1);

  // Expand 0->1 and 1->3 and give 3's only child some statistics.
  auto r1 = Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 0, 1));
  EXPECT_EQ(r1.kind, Algorithms::ExpansionResult::kNewVertex);
  auto r3 = Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 1, 3));
  EXPECT_EQ(r3.kind, Algorithms::ExpansionResult::kNewVertex);
  EXPECT_EQ(r3.seed, Payoff::zero());
  h.graph.edge(find_edge(h.graph, 3, 4)).stats.store(Payoff{3, {6, 0}});

  Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 0, 2));
  auto r = Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 2, 3));
  EXPECT_EQ(r.kind, Algorithms::ExpansionResult::kTransposition);
  EXPECT_EQ(r.target.vertex, r3.target.vertex);
  EXPECT_EQ(r.seed, (Payoff{3, {6, 0}}));
  EXPECT_EQ(h.graph.edge(find_edge(h.graph, 2, 3)).stats.visits(), 0u);

  auto again = Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 2, 3));
  EXPECT_EQ(again.kind, Algorithms::ExpansionResult::kCollision);
}

TEST(Algorithms, transposition_seed_reaches_root) {
  GraphGame::table = &kDiamond;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = h.graph.find_or_create_root(State{0});
  h.graph.expand_vertex(root);
  h.context.init(root, 1);

  Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 0, 1));
  Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 1, 3));
  Algorithms::expand(h.general_context, h.context, find_edge(h.graph, 0, 2));
  edge_index_t e01 = find_edge(h.graph, 0, 1);
  edge_index_t e02 = find_edge(h.graph, 0, 2);
  edge_index_t e23 = find_edge(h.graph, 2, 3);
  vertex_index_t v2 = h.graph.find_vertex(State{2});
  vertex_index_t v3 = h.graph.find_vertex(State{3});

  Payoff seed{3, {6, 0}};
  h.graph.edge(find_edge(h.graph, 3, 4)).stats.store(seed);
  h.graph.edge(e01).stats.store(Payoff{1, {2, 0}});

  // 0->2 is unvisited, so the pass descends 0->2->3 and finds 3 already in the graph.
  auto outcome = Algorithms::iterate(h.general_context, h.context);
  EXPECT_EQ(outcome, Algorithms::kSeeded);
  EXPECT_EQ(h.context.stats.transpositions, 1);
  EXPECT_EQ(h.context.stats.simulations, 0);

  EXPECT_EQ(h.graph.edge(e23).target().vertex, v3);
  EXPECT_EQ(h.graph.edge(e23).stats.as_payoff(), seed);
  EXPECT_EQ(h.graph.edge(e02).stats.as_payoff(), seed);
  EXPECT_EQ(h.graph.edge(e01).stats.as_payoff(), (Payoff{1, {2, 0}}));
  EXPECT_EQ(h.graph.vertex(v2).stats.visits(), 3u);
  EXPECT_EQ(h.graph.vertex(root).stats.visits(), 3u);
  EXPECT_EQ(h.graph.vertex(v3).stats.visits(), 0u);  // already accounts for its children
  EXPECT_TRUE(h.context.touched_edges.empty());
}

TEST(Algorithms, penalized_cycle_edge_stops_being_selected) {
  GraphGame::table = &kLoop;
  AlgorithmsHarness<GraphTraits> h;
  vertex_index_t root = build_graph(h.graph);
  h.context.init(root, 1);

  edge_index_t e10 = find_edge(h.graph, 1, 0);
  edge_index_t e12 = find_edge(h.graph, 1, 2);
  h.graph.edge(e12).stats.store(Payoff{1, {1, 1}});

  // The unvisited cycle edge is selected, closes the loop and is penalized.
  EXPECT_EQ(Algorithms::iterate(h.general_context, h.context), Algorithms::kCycleDetected);
  EXPECT_EQ(h.graph.edge(e10).stats.as_payoff(), (Payoff{1, {0, 0}}));

  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(Algorithms::iterate(h.general_context, h.context), Algorithms::kBackpropagated);
  }
  EXPECT_EQ(h.graph.edge(e10).stats.visits(), 1u);
  EXPECT_EQ(h.graph.edge(e12).stats.visits(), 6u);
  EXPECT_EQ(h.context.stats.cycles, 1);
}

TEST(SearchResults, to_str) {
  mcgs::SearchResults<GraphGame> results;
  results.epoch = 3;
  results.root_visits = 5;
  results.active_player = 0;
  results.actions.push_back({1, 0, Payoff{4, {6, 2}}, {mcgs::UcbResult::kValue, 1.25}});
  results.actions.push_back({2, 1, Payoff::zero(), {mcgs::UcbResult::kSelect, 0}});
  results.stats.iterations = 5;
  results.stats.expansions = 2;

  std::string expected =
    "epoch=3 root_visits=5 player=0\n"
    "  action   visits      avg        ucb  payoff\n"
    "       1        4    1.500     1.2500  [6, 2]@4\n"
    "       2        0    0.000     select  [0, 0]@0\n"
    "iterations=5 expansions=2 transpositions=0 cycles=0 collisions=0 simulations=0";
  EXPECT_EQ(results.to_str(), expected);
}

// Scenario: one ply, one winning and one losing action.
TEST(Manager, prefers_winning_action) {
  GraphGame::table = &kOnePly;
  mcgs::Manager<GraphTraits> manager(make_params(60));
  manager.initialize(State{0});

  auto results = manager.run_round(State{0});
  ASSERT_EQ(results.actions.size(), 2u);
  EXPECT_EQ(results.stats.iterations, 60);
  EXPECT_GT(results.actions[0].payoff.weight, results.actions[1].payoff.weight);
  EXPECT_EQ(manager.select_action(results), 1);

  std::string report = results.to_str();
  EXPECT_NE(report.find(results.actions[0].payoff.to_str()), std::string::npos);
  EXPECT_NE(report.find(results.actions[1].payoff.to_str()), std::string::npos);
  EXPECT_NE(report.find(results.stats.to_str()), std::string::npos);
}

// Scenario: a forced line of three plies.
TEST(Manager, forced_line_accumulates_exactly) {
  GraphGame::table = &kForcedLine;
  constexpr int N = 25;
  mcgs::Manager<GraphTraits> manager(make_params(N));
  manager.initialize(State{0});

  auto results = manager.run_round(State{0});
  ASSERT_EQ(results.actions.size(), 1u);
  Payoff expected{N, {2 * N, 0}};
  EXPECT_EQ(results.actions[0].payoff, expected);
  EXPECT_EQ(results.root_visits, uint32_t(N));
}

TEST(Manager, time_limit_ends_round) {
  GraphGame::table = &kLoop;
  constexpr int N = 100'000'000;
  mcgs::ManagerParams params = make_params(N, 2);
  params.search_time_limit_ms = 50;
  mcgs::Manager<GraphTraits> manager(params);
  manager.initialize(State{0});

  auto start = std::chrono::steady_clock::now();
  auto results = manager.run_round(State{0});
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GT(manager.stats().iterations, 0);
  EXPECT_LT(manager.stats().iterations, N);
  EXPECT_EQ(results.stats.iterations, manager.stats().iterations);
  EXPECT_LT(elapsed, std::chrono::seconds(10));

  // The limit applies per round.
  manager.run_round(State{0});
  EXPECT_GT(manager.stats().iterations, 0);
  EXPECT_LT(manager.stats().iterations, N);
}

// Scenario: many workers on a graph with a branching factor of one.
TEST(Manager, concurrent_workers_report_no_false_cycles) {
  const int kLength = 12;
  GraphGame::Table table;
  for (int i = 0; i < kLength; ++i) {
    table.successors.push_back({i + 1});
    table.players.push_back(i % 2);
  }
  table.successors.push_back({});
  table.players.push_back(kLength % 2);
  table.payoffs[kLength] = {1, 1};
  GraphGame::table = &table;

  constexpr int N = 3000;
  mcgs::Manager<GraphTraits> manager(make_params(N, 8));
  manager.initialize(State{0});

  auto results = manager.run_round(State{0});
  EXPECT_EQ(manager.stats().cycles, 0);
  EXPECT_EQ(manager.stats().iterations, N);
  EXPECT_EQ(manager.graph().num_vertices(), uint64_t(kLength + 1));

  EXPECT_EQ(manager.stats().transpositions, 0);
  const auto& root_edge = results.actions[0];
  EXPECT_EQ(root_edge.payoff.weight, uint32_t(N - manager.stats().collisions));

  // traversal marks are all cleared
  for (edge_index_t e = 0; e < (edge_index_t)manager.graph().num_edges(); ++e) {
    for (mcgs::worker_id_t w = 0; w < 8; ++w) {
      EXPECT_FALSE(manager.graph().edge(e).traversals.rollout_marked(w));
      EXPECT_FALSE(manager.graph().edge(e).traversals.backprop_marked(w));
    }
  }
}

TEST(Manager, loop_game_terminates) {
  GraphGame::table = &kLoop;
  mcgs::Manager<GraphTraits> manager(make_params(200, 2));
  manager.initialize(State{0});

  auto results = manager.run_round(State{0});
  EXPECT_EQ(manager.stats().iterations, 200);
  vertex_index_t v1 = manager.graph().find_vertex(State{1});
  ASSERT_NE(v1, kNullIndex);
  EXPECT_EQ(manager.graph().edge(find_edge(manager.graph(), 1, 0)).target().kind, Edge::kCycle);
  EXPECT_GT(results.actions[0].payoff.weight, 0u);
}

// Under retain, positions from earlier moves stay in the graph but receive no more updates.
TEST(Manager, retained_ancestors_are_frozen) {
  GraphGame::table = &kDiamond;
  mcgs::ManagerParams params = make_params(200);
  params.graph_compaction_str = "retain";
  mcgs::Manager<GraphTraits> manager(params);
  manager.initialize(State{0});
  manager.run_round(State{0});

  const Graph& graph = manager.graph();
  edge_index_t e01 = find_edge(graph, 0, 1);
  edge_index_t e02 = find_edge(graph, 0, 2);
  edge_index_t e13 = find_edge(graph, 1, 3);
  edge_index_t e23 = find_edge(graph, 2, 3);
  ASSERT_NE(e13, kNullIndex);
  ASSERT_NE(e23, kNullIndex);
  Payoff p01 = graph.edge(e01).stats.as_payoff();
  Payoff p02 = graph.edge(e02).stats.as_payoff();
  Payoff p13 = graph.edge(e13).stats.as_payoff();
  uint32_t n23 = graph.edge(e23).stats.visits();
  uint32_t n0 = graph.vertex(graph.find_vertex(State{0})).stats.visits();
  uint32_t n1 = graph.vertex(graph.find_vertex(State{1})).stats.visits();

  manager.commit_action(2);
  auto results = manager.run_round(State{2});
  ASSERT_EQ(results.actions.size(), 1u);

  EXPECT_GE(graph.edge(e23).stats.visits(), n23 + 200);
  EXPECT_EQ(graph.edge(e01).stats.as_payoff(), p01);
  EXPECT_EQ(graph.edge(e02).stats.as_payoff(), p02);
  EXPECT_EQ(graph.edge(e13).stats.as_payoff(), p13);
  EXPECT_EQ(graph.vertex(graph.find_vertex(State{0})).stats.visits(), n0);
  EXPECT_EQ(graph.vertex(graph.find_vertex(State{1})).stats.visits(), n1);
}

TEST(Manager, no_root_state) {
  GraphGame::table = &kDiamond;
  mcgs::Manager<GraphTraits> manager(make_params(10));

  try {
    manager.run_round(State{0});
    FAIL() << "run_round() did not throw";
  } catch (const mcgs::SearchError& e) {
    EXPECT_EQ(e.kind(), mcgs::SearchError::kNoRootState);
  }

  try {
    manager.commit_action(1);
    FAIL() << "commit_action() did not throw";
  } catch (const mcgs::SearchError& e) {
    EXPECT_EQ(e.kind(), mcgs::SearchError::kNoRootState);
  }

  manager.initialize(State{0});
  EXPECT_NO_THROW(manager.run_round(State{0}));
}

TEST(Manager, no_terminal_payoff) {
  GraphGame::table = &kBrokenGame;
  mcgs::Manager<GraphTraits> manager(make_params(10, 2));
  manager.initialize(State{0});

  try {
    manager.run_round(State{0});
    FAIL() << "run_round() did not throw";
  } catch (const mcgs::SearchError& e) {
    EXPECT_EQ(e.kind(), mcgs::SearchError::kNoTerminalPayoff);
  }
}

TEST(Manager, selector_error_leaves_graph_usable) {
  GraphGame::table = &kOnePly;
  mcgs::ManagerParams params = make_params(10);
  params.explore_bias = std::numeric_limits<float>::quiet_NaN();
  mcgs::Manager<GraphTraits> manager(params);
  manager.initialize(State{0});

  try {
    manager.run_round(State{0});
    FAIL() << "run_round() did not throw";
  } catch (const mcgs::SearchError& e) {
    EXPECT_EQ(e.kind(), mcgs::SearchError::kSelector);
  }

  // The first pass expanded one child before the second pass hit a NaN score.
  EXPECT_EQ(manager.graph().num_vertices(), 2u);
  for (edge_index_t e = 0; e < (edge_index_t)manager.graph().num_edges(); ++e) {
    EXPECT_FALSE(manager.graph().edge(e).traversals.rollout_marked(0));
  }
}

TEST(Manager, invalid_params) {
  GraphGame::table = &kOnePly;
  EXPECT_THROW(mcgs::Manager<GraphTraits>(make_params(10, 0)), util::CleanException);
  EXPECT_THROW(mcgs::Manager<GraphTraits>(make_params(10, mcgs::kMaxWorkers + 1)),
               util::CleanException);

  mcgs::ManagerParams params = make_params(10);
  params.graph_compaction_str = "shrink";
  EXPECT_THROW(mcgs::Manager<GraphTraits>{params}, util::CleanException);
}

TEST(ManagerParams, options) {
  namespace po2 = boost_util::program_options;

  mcgs::ManagerParams params;
  EXPECT_EQ(params.graph_compaction(), mcgs::ManagerParams::kPrune);
  EXPECT_EQ(params.action_select(), mcgs::ManagerParams::kVisitCount);

  std::vector<std::string> args = {"--num-iterations", "77", "--graph-compaction", "retain",
                                   "--action-select", "ucb", "-b", "1.5"};
  po2::parse_args(params.make_options_description(), args);
  EXPECT_EQ(params.num_iterations, 77);
  EXPECT_EQ(params.graph_compaction(), mcgs::ManagerParams::kRetain);
  EXPECT_EQ(params.action_select(), mcgs::ManagerParams::kUcb);
  EXPECT_FLOAT_EQ(params.explore_bias, 1.5);

  params.graph_compaction_str = "CLEAR";
  EXPECT_EQ(params.graph_compaction(), mcgs::ManagerParams::kClear);
  params.action_select_str = "most-visits";
  EXPECT_THROW(params.action_select(), util::CleanException);
}

using TictactoeTraits = mcgs::Traits<tictactoe::Game>;

class TictactoeManagerTest : public ::testing::TestWithParam<std::string> {};

TEST_P(TictactoeManagerTest, commit_action) {
  mcgs::ManagerParams params = make_params(300, 2);
  params.graph_compaction_str = GetParam();
  mcgs::Manager<TictactoeTraits> manager(params);

  tictactoe::Game::State state;
  tictactoe::Game::Rules::init_state(state);
  manager.initialize(state);

  auto results = manager.run_round(state);
  EXPECT_EQ(results.actions.size(), 9u);
  uint64_t num_vertices = manager.graph().num_vertices();

  auto action = manager.select_action(results);
  manager.commit_action(action);
  tictactoe::Game::Rules::apply(state, action);

  EXPECT_EQ(manager.graph().vertex(manager.root()).state, state);
  EXPECT_TRUE(manager.graph().vertex(manager.root()).is_expanded());
  if (GetParam() == "retain") {
    EXPECT_EQ(manager.graph().num_vertices(), num_vertices);
  } else {
    EXPECT_LT(manager.graph().num_vertices(), num_vertices);
  }

  results = manager.run_round(state);
  EXPECT_EQ(results.actions.size(), 8u);
  EXPECT_EQ(results.epoch, 2u);

  EXPECT_THROW(manager.commit_action(action), util::Exception);  // occupied cell
}

INSTANTIATE_TEST_SUITE_P(GraphCompaction, TictactoeManagerTest,
                         ::testing::Values("prune", "clear", "retain"));

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
