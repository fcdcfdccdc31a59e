#include "mcgs/Traversals.hpp"

namespace mcgs {

inline Traversals& Traversals::operator=(const Traversals& other) {
  rollout_.store(other.rollout_.load(std::memory_order_relaxed), std::memory_order_relaxed);
  backprop_.store(other.backprop_.load(std::memory_order_relaxed), std::memory_order_relaxed);
  return *this;
}

inline bool Traversals::mark_rollout(worker_id_t w) {
  uint64_t b = bit(w);
  backprop_.fetch_and(~b, std::memory_order_acq_rel);
  return rollout_.fetch_or(b, std::memory_order_acq_rel) & b;
}

inline bool Traversals::mark_backprop(worker_id_t w) {
  uint64_t b = bit(w);
  rollout_.fetch_and(~b, std::memory_order_acq_rel);
  return backprop_.fetch_or(b, std::memory_order_acq_rel) & b;
}

inline void Traversals::clear(worker_id_t w) {
  uint64_t b = bit(w);
  rollout_.fetch_and(~b, std::memory_order_acq_rel);
  backprop_.fetch_and(~b, std::memory_order_acq_rel);
}

}  // namespace mcgs
