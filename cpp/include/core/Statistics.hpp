#pragma once

#include "core/BasicTypes.hpp"
#include "core/Payoff.hpp"

#include <atomic>
#include <cstdint>

namespace core {

/*
 * Atomically mutable game statistics, counting the number of observed outcomes (visits) and the
 * per-player sum of final scores.
 *
 * All fields are packed into a single 64-bit word so that increment() is a single compare-and-swap
 * loop. The upper kVisitBits bits hold the visit count; the remaining bits are split evenly across
 * the players, with player 0 in the most significant slot. Each field saturates at its maximum
 * value rather than overflowing.
 *
 * Copying is a plain load/store of the packed word. It is only meant for moving statistics around
 * while no other thread is accessing them (see util::AllocPool::defragment()).
 */
template <int NumPlayers>
class Statistics {
 public:
  static constexpr int kNumPlayers = NumPlayers;
  static constexpr int kVisitBits = 20;
  static constexpr int kScoreBits = (64 - kVisitBits) / kNumPlayers;
  static constexpr uint64_t kVisitsMax = (uint64_t(1) << kVisitBits) - 1;
  static constexpr uint64_t kScoreMax = (uint64_t(1) << kScoreBits) - 1;

  static_assert(kNumPlayers >= 1 && kScoreBits >= 8, "too many players to pack");

  using Payoff = core::Payoff<kNumPlayers>;

  Statistics() = default;
  Statistics(const Statistics& other) : packed_(other.packed_.load(std::memory_order_relaxed)) {}
  Statistics& operator=(const Statistics& other);

  uint32_t visits() const;
  uint32_t score(core::player_index_t p) const;

  // Adds payoff.weight to the visit count and payoff.scores[p] to each player's score.
  void increment(const Payoff& payoff);

  // Overwrites the statistics with the (saturated) contents of payoff.
  void store(const Payoff& payoff);

  Payoff as_payoff() const;

 private:
  static uint64_t pack(const Payoff& payoff);
  static Payoff unpack(uint64_t packed);
  static int score_shift(core::player_index_t p) { return (kNumPlayers - 1 - p) * kScoreBits; }

  std::atomic<uint64_t> packed_ = 0;
};

}  // namespace core

#include "inline/core/Statistics.inl"
