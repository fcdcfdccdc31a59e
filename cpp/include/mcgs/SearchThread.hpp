#pragma once

#include "mcgs/Algorithms.hpp"
#include "mcgs/SearchContext.hpp"
#include "mcgs/SharedData.hpp"
#include "mcgs/TypeDefs.hpp"
#include "mcgs/concepts/TraitsConcept.hpp"

#include <thread>

namespace mcgs {

/*
 * A persistent worker. Each round, the Manager activates every SearchThread; the thread then runs
 * passes until the shared iteration budget is exhausted and deactivates itself.
 *
 * Errors other than cycles (which Algorithms::iterate() absorbs) are handed to SharedData, which
 * stops the round and lets the Manager rethrow them.
 */
template <mcgs::concepts::Traits Traits>
class SearchThread {
 public:
  using Algorithms = mcgs::Algorithms<Traits>;
  using SearchContext = mcgs::SearchContext<Traits>;
  using SharedData = mcgs::SharedData<Traits>;

  SearchThread(SharedData* shared_data, worker_id_t id);
  ~SearchThread();

  SearchThread(const SearchThread&) = delete;
  SearchThread& operator=(const SearchThread&) = delete;

  void start();
  worker_id_t id() const { return context_.worker_id; }
  const RoundStats& stats() const { return context_.stats; }

 private:
  void wait_for_activation() const;
  void perform_visits();
  void deactivate() const;
  void loop();

  SharedData* const shared_data_;
  SearchContext context_;
  std::thread thread_;
};

}  // namespace mcgs

#include "inline/mcgs/SearchThread.inl"
