#pragma once

#include "mcgs/GeneralContext.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchGraph.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/concepts/TraitsConcept.hpp"

#include <boost/dynamic_bitset.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>

namespace mcgs {

/*
 * SharedData is owned by the Manager and shared by the search threads.
 *
 * It is separated from Manager to avoid circular dependencies.
 */
template <mcgs::concepts::Traits Traits>
struct SharedData {
  using Game = Traits::Game;
  using SearchGraph = mcgs::SearchGraph<Game>;
  using GeneralContext = mcgs::GeneralContext<Traits>;

  SharedData(const ManagerParams& params);
  SharedData(const SharedData&) = delete;
  SharedData& operator=(const SharedData&) = delete;

  // Sets up the iteration budget for a new round.
  void start_round(vertex_index_t root_vertex);

  // Returns true if the calling thread may run one more pass.
  bool claim_iteration();

  // Records the first error of the round and stops the other threads.
  void record_error(std::exception_ptr error);

  // Rethrows the error recorded during the round, if any.
  void rethrow_error();

  SearchGraph graph;
  GeneralContext general_context;
  vertex_index_t root = kNullIndex;
  epoch_t epoch = 0;

  std::mutex search_mutex;
  std::condition_variable cv_search_on, cv_search_off;
  boost::dynamic_bitset<> active_search_threads;
  bool shutting_down = false;

 private:
  const ManagerParams& params_;

  std::atomic<int> remaining_iterations_ = 0;
  std::atomic<bool> aborted_ = false;
  time_point_t deadline_;

  std::mutex error_mutex_;
  std::exception_ptr error_;
};

}  // namespace mcgs

#include "inline/mcgs/SharedData.inl"
