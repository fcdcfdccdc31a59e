#pragma once

#include "core/concepts/Game.hpp"
#include "mcgs/Traversals.hpp"
#include "mcgs/TypeDefs.hpp"

#include <atomic>
#include <cstdint>

namespace mcgs {

/*
 * An Edge corresponds to an action that can be taken from its source vertex.
 *
 * The target starts out unexpanded and is resolved exactly once, under the graph's exclusive lock,
 * to either kExpanded(v) or kCycle(v). kCycle(v) means that a path of expanded edges already led
 * from v back to the source vertex when the edge was resolved.
 *
 * Edges are stored by value in a util::AllocPool. The link fields form two intrusive lists: the
 * children of the source vertex (next_sibling) and the parents of the target vertex (next_parent).
 */
template <core::concepts::Game Game>
struct Edge {
  using Action = Game::Action;
  using Statistics = Game::Statistics;

  enum target_kind_t : int8_t { kUnexpanded, kExpanded, kCycle };

  struct Target {
    bool operator==(const Target&) const = default;

    target_kind_t kind = kUnexpanded;
    vertex_index_t vertex = kNullIndex;
  };

  Edge() = default;
  Edge(const Edge& other) { *this = other; }
  Edge& operator=(const Edge& other);

  Target target() const { return decode(packed_target_.load(std::memory_order_acquire)); }

  // Publishes the target. Returns false, leaving the edge untouched, if it was already resolved.
  bool resolve(const Target& target);

  // Used when compacting the graph, under exclusive access.
  void remap_target(vertex_index_t vertex);

  Action action;
  vertex_index_t source = kNullIndex;
  Statistics stats;
  Traversals traversals;
  std::atomic<edge_index_t> next_sibling = kNullIndex;
  std::atomic<edge_index_t> next_parent = kNullIndex;

 private:
  static constexpr int64_t kUnexpandedCode = -1;

  // An expanded or cyclic target is encoded as 2*vertex + (kind == kCycle).
  static int64_t encode(const Target& t);
  static Target decode(int64_t code);

  std::atomic<int64_t> packed_target_ = kUnexpandedCode;
};

}  // namespace mcgs

#include "inline/mcgs/Edge.inl"
