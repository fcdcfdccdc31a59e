#include "mcgs/Vertex.hpp"

namespace mcgs {

template <core::concepts::Game Game>
Vertex<Game>& Vertex<Game>::operator=(const Vertex& other) {
  constexpr auto relaxed = std::memory_order_relaxed;

  state = other.state;
  terminal_payoff = other.terminal_payoff;
  active_player = other.active_player;
  stats = other.stats;
  expanded.store(other.expanded.load(relaxed), relaxed);
  cyclic.store(other.cyclic.load(relaxed), relaxed);
  detached.store(other.detached.load(relaxed), relaxed);
  first_child.store(other.first_child.load(relaxed), relaxed);
  first_parent.store(other.first_parent.load(relaxed), relaxed);
  last_child = other.last_child;
  last_parent = other.last_parent;
  num_children.store(other.num_children.load(relaxed), relaxed);
  num_parents.store(other.num_parents.load(relaxed), relaxed);
  proven_payoff_ = other.proven_payoff_;
  proven_state_.store(other.proven_state_.load(relaxed), relaxed);
  return *this;
}

template <core::concepts::Game Game>
std::optional<typename Game::Payoff> Vertex<Game>::known_payoff() const {
  if (terminal_payoff) return terminal_payoff;
  if (is_proven()) return proven_payoff_;
  return std::nullopt;
}

template <core::concepts::Game Game>
bool Vertex<Game>::set_proven(const Payoff& payoff) {
  int8_t expected = kUnproven;
  if (!proven_state_.compare_exchange_strong(expected, kWriting, std::memory_order_acq_rel)) {
    return false;
  }
  proven_payoff_ = payoff;
  proven_state_.store(kProven, std::memory_order_release);
  return true;
}

}  // namespace mcgs
