#pragma once

#include "core/BasicTypes.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace core {

/*
 * Payoff for games in which each player receives a whole-number score at the end of the game.
 *
 * weight is the number of game outcomes folded into the payoff, and scores[p] is the sum of player
 * p's final scores over those outcomes. A single terminal state yields a payoff of weight 1.
 */
template <int NumPlayers>
struct Payoff {
  static constexpr int kNumPlayers = NumPlayers;
  using score_array_t = std::array<uint32_t, kNumPlayers>;

  static Payoff zero() { return Payoff{}; }

  // Payoff of weight 1 with the given per-player scores.
  static Payoff outcome(const score_array_t& scores) { return Payoff{1, scores}; }

  uint32_t score(core::player_index_t p) const { return scores[p]; }

  Payoff& operator+=(const Payoff& other);
  Payoff operator+(const Payoff& other) const;
  bool operator==(const Payoff& other) const = default;

  std::string to_str() const;

  uint32_t weight = 0;
  score_array_t scores = {};
};

}  // namespace core

#include "inline/core/Payoff.inl"
