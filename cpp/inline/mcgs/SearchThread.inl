#include "mcgs/SearchThread.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <exception>
#include <mutex>

namespace mcgs {

template <mcgs::concepts::Traits Traits>
SearchThread<Traits>::SearchThread(SharedData* shared_data, worker_id_t id)
    : shared_data_(shared_data), context_(id, util::Random::derive_seed()) {}

template <mcgs::concepts::Traits Traits>
SearchThread<Traits>::~SearchThread() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

template <mcgs::concepts::Traits Traits>
void SearchThread<Traits>::start() {
  RELEASE_ASSERT(!thread_.joinable(), "search thread {} already started", id());
  thread_ = std::thread([this] { loop(); });
}

template <mcgs::concepts::Traits Traits>
void SearchThread<Traits>::wait_for_activation() const {
  std::unique_lock lock(shared_data_->search_mutex);
  shared_data_->cv_search_on.wait(lock, [this] {
    return shared_data_->shutting_down || shared_data_->active_search_threads[id()];
  });
}

template <mcgs::concepts::Traits Traits>
void SearchThread<Traits>::perform_visits() {
  context_.init(shared_data_->root, shared_data_->epoch);

  while (shared_data_->claim_iteration()) {
    try {
      auto outcome = Algorithms::iterate(shared_data_->general_context, context_);
      if (outcome == Algorithms::kRootTerminal) break;
    } catch (const std::exception& e) {
      LOG_DEBUG("{:>{}}search thread {} stopping: {}", "", context_.log_prefix_n(), id(),
                e.what());
      shared_data_->record_error(std::current_exception());
      break;
    }
  }
}

template <mcgs::concepts::Traits Traits>
void SearchThread<Traits>::deactivate() const {
  std::unique_lock lock(shared_data_->search_mutex);
  shared_data_->active_search_threads[id()] = false;
  shared_data_->cv_search_off.notify_all();
}

template <mcgs::concepts::Traits Traits>
void SearchThread<Traits>::loop() {
  while (true) {
    wait_for_activation();
    {
      std::unique_lock lock(shared_data_->search_mutex);
      if (shared_data_->shutting_down) break;
    }
    perform_visits();
    deactivate();
  }
}

}  // namespace mcgs
