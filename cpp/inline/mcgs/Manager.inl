#include "mcgs/Manager.hpp"

#include "mcgs/Constants.hpp"
#include "mcgs/SearchError.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <limits>
#include <mutex>
#include <shared_mutex>

namespace mcgs {

template <mcgs::concepts::Traits Traits>
Manager<Traits>::Manager(const ManagerParams& params)
    : params_(params),
      graph_compaction_(params.graph_compaction()),
      action_select_(params.action_select()),
      shared_data_(params_),
      prng_(util::Random::derive_seed()) {
  CLEAN_ASSERT(params_.num_search_threads >= 1 && params_.num_search_threads <= kMaxWorkers,
               "num_search_threads must be in [1, {}] (got {})", kMaxWorkers,
               params_.num_search_threads);
  CLEAN_ASSERT(params_.simulation_count >= 1, "simulation_count must be positive (got {})",
               params_.simulation_count);
  CLEAN_ASSERT(params_.num_iterations >= 0, "num_iterations must be non-negative (got {})",
               params_.num_iterations);

  for (int i = 0; i < params_.num_search_threads; ++i) {
    search_threads_.push_back(std::make_unique<SearchThread>(&shared_data_, i));
  }
  for (auto& thread : search_threads_) {
    thread->start();
  }
}

template <mcgs::concepts::Traits Traits>
Manager<Traits>::~Manager() {
  shut_down();
}

template <mcgs::concepts::Traits Traits>
void Manager<Traits>::initialize(const State& state) {
  shared_data_.root = init_vertex(state);
  LOG_DEBUG("initialize(): root={} state={}", shared_data_.root, IO::compact_state_repr(state));
}

template <mcgs::concepts::Traits Traits>
typename Manager<Traits>::SearchResults Manager<Traits>::run_round(const State& state) {
  SearchGraph& graph = shared_data_.graph;

  vertex_index_t root;
  {
    std::shared_lock lock(graph.mutex());
    root = graph.find_vertex(state);
  }
  if (root == kNullIndex) {
    throw SearchError(SearchError::kNoRootState, "no vertex for root state {}",
                      IO::compact_state_repr(state));
  }
  init_vertex(state);  // expands root if needed

  if (graph_compaction_ == ManagerParams::kRetain) {
    std::unique_lock lock(graph.mutex());
    graph.detach_unreachable(root);
  }

  shared_data_.start_round(root);
  stats_ = RoundStats();

  if (!graph.vertex(root).is_terminal() && params_.num_iterations > 0) {
    start_search_threads();
    wait_for_search_threads();
    for (const auto& thread : search_threads_) {
      stats_ += thread->stats();
    }
  }
  shared_data_.rethrow_error();

  SearchResults results =
    Algorithms::to_results(shared_data_.general_context, root, shared_data_.epoch);
  results.stats = stats_;

  LOG_DEBUG("run_round(): epoch={} root_visits={} vertices={} edges={} {}", results.epoch,
            results.root_visits, graph.num_vertices(), graph.num_edges(), stats_.to_str());
  return results;
}

template <mcgs::concepts::Traits Traits>
typename Manager<Traits>::Action Manager<Traits>::select_action(const SearchResults& results) {
  if (results.actions.empty()) {
    throw util::Exception("select_action(): no actions to choose from (epoch={})", results.epoch);
  }

  constexpr double kInf = std::numeric_limits<double>::infinity();

  int choice = -1;
  double best = 0;
  uint64_t num_ties = 0;
  for (int i = 0; i < (int)results.actions.size(); ++i) {
    const auto& entry = results.actions[i];

    double key;
    if (action_select_ == ManagerParams::kVisitCount) {
      key = entry.payoff.weight;
    } else if (entry.ucb.kind == UcbResult::kSelect) {
      key = kInf;
    } else if (entry.ucb.kind == UcbResult::kValue) {
      key = entry.ucb.value;
    } else {
      key = -kInf;
    }

    if (choice < 0 || key > best) {
      choice = i;
      best = key;
      num_ties = 1;
    } else if (key == best) {
      ++num_ties;
      if (util::Random::replace_with_probability(prng_, num_ties)) {
        choice = i;
      }
    }
  }
  return results.actions[choice].action;
}

template <mcgs::concepts::Traits Traits>
void Manager<Traits>::commit_action(const Action& action) {
  SearchGraph& graph = shared_data_.graph;
  vertex_index_t root = shared_data_.root;
  if (root == kNullIndex) {
    throw SearchError(SearchError::kNoRootState, "commit_action() called before initialize()");
  }

  const State& root_state = graph.vertex(root).state;
  bool legal = false;
  Rules::for_each_action(root_state, [&](const Action& a) {
    legal = (a == action);
    return legal ? core::kBreak : core::kContinue;
  });
  if (!legal) {
    throw util::Exception("commit_action(): illegal action {} in state {}",
                          IO::action_to_str(action), IO::compact_state_repr(root_state));
  }

  State next_state = root_state;
  Rules::apply(next_state, action);

  switch (graph_compaction_) {
    case ManagerParams::kPrune: {
      std::vector<vertex_index_t> roots;
      vertex_index_t next_root = graph.find_vertex(next_state);
      if (next_root != kNullIndex) {
        roots.push_back(next_root);
        graph.prune(roots);
      } else {
        graph.clear();
      }
      break;
    }
    case ManagerParams::kClear: {
      graph.clear();
      break;
    }
    default: {
      break;
    }
  }

  shared_data_.root = init_vertex(next_state);
  LOG_DEBUG("commit_action(): {} root={} vertices={} edges={}", IO::action_to_str(action),
            shared_data_.root, graph.num_vertices(), graph.num_edges());
}

template <mcgs::concepts::Traits Traits>
vertex_index_t Manager<Traits>::init_vertex(const State& state) {
  SearchGraph& graph = shared_data_.graph;
  std::unique_lock lock(graph.mutex());
  vertex_index_t v = graph.find_or_create_root(state);
  graph.expand_vertex(v);
  return v;
}

template <mcgs::concepts::Traits Traits>
void Manager<Traits>::start_search_threads() {
  std::unique_lock lock(shared_data_.search_mutex);
  shared_data_.active_search_threads.set();
  shared_data_.cv_search_on.notify_all();
}

template <mcgs::concepts::Traits Traits>
void Manager<Traits>::wait_for_search_threads() {
  std::unique_lock lock(shared_data_.search_mutex);
  shared_data_.cv_search_off.wait(lock,
                                  [&] { return shared_data_.active_search_threads.none(); });
}

template <mcgs::concepts::Traits Traits>
void Manager<Traits>::shut_down() {
  {
    std::unique_lock lock(shared_data_.search_mutex);
    shared_data_.shutting_down = true;
    shared_data_.cv_search_on.notify_all();
  }
  search_threads_.clear();  // joins
}

}  // namespace mcgs
