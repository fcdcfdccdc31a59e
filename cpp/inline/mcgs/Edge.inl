#include "mcgs/Edge.hpp"

#include "util/Asserts.hpp"

namespace mcgs {

template <core::concepts::Game Game>
Edge<Game>& Edge<Game>::operator=(const Edge& other) {
  action = other.action;
  source = other.source;
  stats = other.stats;
  traversals = other.traversals;
  next_sibling.store(other.next_sibling.load(std::memory_order_relaxed), std::memory_order_relaxed);
  next_parent.store(other.next_parent.load(std::memory_order_relaxed), std::memory_order_relaxed);
  packed_target_.store(other.packed_target_.load(std::memory_order_relaxed),
                       std::memory_order_relaxed);
  return *this;
}

template <core::concepts::Game Game>
bool Edge<Game>::resolve(const Target& target) {
  RELEASE_ASSERT(target.kind != kUnexpanded && target.vertex >= 0, "bad edge target ({}, {})",
                 int(target.kind), target.vertex);
  int64_t expected = kUnexpandedCode;
  return packed_target_.compare_exchange_strong(expected, encode(target),
                                                std::memory_order_acq_rel);
}

template <core::concepts::Game Game>
void Edge<Game>::remap_target(vertex_index_t vertex) {
  Target t = target();
  if (t.kind == kUnexpanded) return;
  t.vertex = vertex;
  packed_target_.store(encode(t), std::memory_order_relaxed);
}

template <core::concepts::Game Game>
int64_t Edge<Game>::encode(const Target& t) {
  return 2 * t.vertex + (t.kind == kCycle ? 1 : 0);
}

template <core::concepts::Game Game>
typename Edge<Game>::Target Edge<Game>::decode(int64_t code) {
  if (code < 0) return Target{};
  return Target{(code & 1) ? kCycle : kExpanded, code >> 1};
}

}  // namespace mcgs
