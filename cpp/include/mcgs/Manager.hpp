#pragma once

#include "mcgs/Algorithms.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/SearchResults.hpp"
#include "mcgs/SearchThread.hpp"
#include "mcgs/SharedData.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/concepts/TraitsConcept.hpp"

#include <memory>
#include <random>
#include <vector>

namespace mcgs {

/*
 * The Manager owns a search graph and a pool of SearchThread's. Usage:
 *
 * mcgs::Manager<Traits> manager(params);
 * manager.initialize(state);
 * while (...) {
 *   auto results = manager.run_round(state);
 *   auto action = manager.select_action(results);
 *   manager.commit_action(action);
 *   Game::Rules::apply(state, action);
 * }
 *
 * The Manager is not itself thread-safe: its methods must be called from a single thread.
 */
template <mcgs::concepts::Traits Traits>
class Manager {
 public:
  using Game = Traits::Game;
  using State = Game::State;
  using Action = Game::Action;
  using Rules = Game::Rules;
  using IO = Game::IO;
  using Algorithms = mcgs::Algorithms<Traits>;
  using SearchGraph = mcgs::SearchGraph<Game>;
  using SearchResults = mcgs::SearchResults<Game>;
  using SearchThread = mcgs::SearchThread<Traits>;
  using SharedData = mcgs::SharedData<Traits>;

  Manager(const ManagerParams& params);
  ~Manager();

  Manager(const Manager&) = delete;
  Manager& operator=(const Manager&) = delete;

  // Makes state the logical root, creating and expanding its vertex if needed.
  void initialize(const State& state);

  /*
   * Runs one round of num_iterations passes (or until the time limit) from state's vertex, which
   * becomes the logical root.
   *
   * Throws SearchError(kNoRootState) if state has no vertex. Any other SearchError raised by a
   * worker aborts the round and is rethrown here; the graph remains valid.
   */
  SearchResults run_round(const State& state);

  // Picks the action to play, per ManagerParams::action_select. Ties are broken uniformly.
  Action select_action(const SearchResults& results);

  /*
   * Advances the logical root through action and compacts the graph per
   * ManagerParams::graph_compaction.
   *
   * Throws SearchError(kNoRootState) if there is no logical root yet.
   */
  void commit_action(const Action& action);

  const SearchGraph& graph() const { return shared_data_.graph; }
  SearchGraph& graph() { return shared_data_.graph; }
  vertex_index_t root() const { return shared_data_.root; }

  // Counters of the most recent round.
  const RoundStats& stats() const { return stats_; }

 private:
  using search_thread_vec_t = std::vector<std::unique_ptr<SearchThread>>;

  vertex_index_t init_vertex(const State& state);
  void start_search_threads();
  void wait_for_search_threads();
  void shut_down();

  const ManagerParams params_;
  const ManagerParams::graph_compaction_t graph_compaction_;
  const ManagerParams::action_select_t action_select_;
  SharedData shared_data_;
  search_thread_vec_t search_threads_;
  RoundStats stats_;
  std::mt19937 prng_;
};

}  // namespace mcgs

#include "inline/mcgs/Manager.inl"
