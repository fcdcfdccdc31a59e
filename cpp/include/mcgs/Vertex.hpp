#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"
#include "mcgs/TypeDefs.hpp"

#include <atomic>
#include <cstdint>
#include <optional>

namespace mcgs {

/*
 * One Vertex exists per distinct game state.
 *
 * state, terminal_payoff and active_player are written once when the vertex is created and are
 * read-only afterwards. The child and parent lists are appended to only under the graph's exclusive
 * lock; the list heads and links are atomics so that they can be walked without locking. The
 * last_child and last_parent tails are only touched under the lock.
 *
 * expanded flips false -> true exactly once, after all children have been appended.
 *
 * detached is set on vertices that are not reachable from the current root. It is only maintained
 * when the graph is retained across moves.
 */
template <core::concepts::Game Game>
struct Vertex {
  using State = Game::State;
  using Payoff = Game::Payoff;
  using Statistics = Game::Statistics;

  Vertex() = default;
  Vertex(const Vertex& other) { *this = other; }
  Vertex& operator=(const Vertex& other);

  bool is_terminal() const { return terminal_payoff.has_value(); }
  bool is_expanded() const { return expanded.load(std::memory_order_acquire); }
  bool is_cyclic() const { return cyclic.load(std::memory_order_acquire); }
  bool is_detached() const { return detached.load(std::memory_order_acquire); }
  bool is_proven() const { return proven_state_.load(std::memory_order_acquire) == kProven; }

  // Returns the terminal payoff if the state is terminal, else the proven payoff if one has been
  // established, else std::nullopt.
  std::optional<Payoff> known_payoff() const;

  // Sets the proven payoff. Only the first call has an effect. Returns true if this call set it.
  bool set_proven(const Payoff& payoff);

  State state;
  std::optional<Payoff> terminal_payoff;
  core::player_index_t active_player = -1;

  Statistics stats;
  std::atomic<bool> expanded = false;
  std::atomic<bool> cyclic = false;
  std::atomic<bool> detached = false;

  std::atomic<edge_index_t> first_child = kNullIndex;
  std::atomic<edge_index_t> first_parent = kNullIndex;
  edge_index_t last_child = kNullIndex;
  edge_index_t last_parent = kNullIndex;
  std::atomic<int> num_children = 0;
  std::atomic<int> num_parents = 0;

 private:
  enum proven_state_t : int8_t { kUnproven, kWriting, kProven };

  Payoff proven_payoff_;
  std::atomic<int8_t> proven_state_ = kUnproven;
};

}  // namespace mcgs

#include "inline/mcgs/Vertex.inl"
