#pragma once

#include "mcgs/TypeDefs.hpp"

#include <atomic>
#include <cstdint>

namespace mcgs {

/*
 * Per-edge traversal marks. Each worker w owns bit w of two masks: one for the rollout lane and one
 * for the backprop lane. Marking an edge in one lane clears the worker's bit in the other lane, so
 * per worker the two lanes are mutually exclusive.
 *
 * A worker clears its bits on every edge it touched at the end of each pass. A mark_*() call that
 * returns true therefore means the worker already visited the edge during the current pass.
 */
class Traversals {
 public:
  Traversals() = default;
  Traversals(const Traversals& other) { *this = other; }
  Traversals& operator=(const Traversals& other);

  // Sets w's rollout bit and clears its backprop bit. Returns true if the rollout bit was already
  // set.
  bool mark_rollout(worker_id_t w);

  // Sets w's backprop bit and clears its rollout bit. Returns true if the backprop bit was already
  // set.
  bool mark_backprop(worker_id_t w);

  void clear(worker_id_t w);

  bool rollout_marked(worker_id_t w) const { return rollout_.load() & bit(w); }
  bool backprop_marked(worker_id_t w) const { return backprop_.load() & bit(w); }

 private:
  static uint64_t bit(worker_id_t w) { return uint64_t(1) << w; }

  std::atomic<uint64_t> rollout_ = 0;
  std::atomic<uint64_t> backprop_ = 0;
};

}  // namespace mcgs

#include "inline/mcgs/Traversals.inl"
