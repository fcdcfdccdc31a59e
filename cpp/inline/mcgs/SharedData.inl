#include "mcgs/SharedData.hpp"

#include "util/CppUtil.hpp"

#include <chrono>

namespace mcgs {

template <mcgs::concepts::Traits Traits>
SharedData<Traits>::SharedData(const ManagerParams& params)
    : general_context(params, graph), params_(params) {
  active_search_threads.resize(params.num_search_threads);
}

template <mcgs::concepts::Traits Traits>
void SharedData<Traits>::start_round(vertex_index_t root_vertex) {
  root = root_vertex;
  epoch++;
  remaining_iterations_ = params_.num_iterations;
  aborted_ = false;
  deadline_ = std::chrono::steady_clock::now() +
              std::chrono::nanoseconds(util::ms_to_ns(params_.search_time_limit_ms));

  std::unique_lock lock(error_mutex_);
  error_ = nullptr;
}

template <mcgs::concepts::Traits Traits>
bool SharedData<Traits>::claim_iteration() {
  if (aborted_.load(std::memory_order_relaxed)) return false;
  if (params_.search_time_limit_ms > 0 && std::chrono::steady_clock::now() >= deadline_) {
    return false;
  }
  return remaining_iterations_.fetch_sub(1, std::memory_order_relaxed) > 0;
}

template <mcgs::concepts::Traits Traits>
void SharedData<Traits>::record_error(std::exception_ptr error) {
  aborted_ = true;
  std::unique_lock lock(error_mutex_);
  if (!error_) error_ = error;
}

template <mcgs::concepts::Traits Traits>
void SharedData<Traits>::rethrow_error() {
  std::unique_lock lock(error_mutex_);
  if (!error_) return;
  std::exception_ptr error = error_;
  error_ = nullptr;
  lock.unlock();
  std::rethrow_exception(error);
}

}  // namespace mcgs
