#include "core/Statistics.hpp"

#include <algorithm>

namespace core {

template <int NumPlayers>
Statistics<NumPlayers>& Statistics<NumPlayers>::operator=(const Statistics& other) {
  packed_.store(other.packed_.load(std::memory_order_relaxed), std::memory_order_relaxed);
  return *this;
}

template <int NumPlayers>
uint32_t Statistics<NumPlayers>::visits() const {
  return packed_.load(std::memory_order_acquire) >> (64 - kVisitBits);
}

template <int NumPlayers>
uint32_t Statistics<NumPlayers>::score(core::player_index_t p) const {
  return (packed_.load(std::memory_order_acquire) >> score_shift(p)) & kScoreMax;
}

template <int NumPlayers>
void Statistics<NumPlayers>::increment(const Payoff& payoff) {
  uint64_t old_packed = packed_.load(std::memory_order_relaxed);
  uint64_t new_packed;
  do {
    Payoff sum = unpack(old_packed);
    sum.weight = std::min<uint64_t>(uint64_t(sum.weight) + payoff.weight, kVisitsMax);
    for (int p = 0; p < kNumPlayers; ++p) {
      sum.scores[p] = std::min<uint64_t>(uint64_t(sum.scores[p]) + payoff.scores[p], kScoreMax);
    }
    new_packed = pack(sum);
  } while (!packed_.compare_exchange_weak(old_packed, new_packed, std::memory_order_acq_rel,
                                          std::memory_order_relaxed));
}

template <int NumPlayers>
void Statistics<NumPlayers>::store(const Payoff& payoff) {
  packed_.store(pack(payoff), std::memory_order_release);
}

template <int NumPlayers>
typename Statistics<NumPlayers>::Payoff Statistics<NumPlayers>::as_payoff() const {
  return unpack(packed_.load(std::memory_order_acquire));
}

template <int NumPlayers>
uint64_t Statistics<NumPlayers>::pack(const Payoff& payoff) {
  uint64_t packed = std::min<uint64_t>(payoff.weight, kVisitsMax) << (64 - kVisitBits);
  for (int p = 0; p < kNumPlayers; ++p) {
    packed |= std::min<uint64_t>(payoff.scores[p], kScoreMax) << score_shift(p);
  }
  return packed;
}

template <int NumPlayers>
typename Statistics<NumPlayers>::Payoff Statistics<NumPlayers>::unpack(uint64_t packed) {
  Payoff payoff;
  payoff.weight = packed >> (64 - kVisitBits);
  for (int p = 0; p < kNumPlayers; ++p) {
    payoff.scores[p] = (packed >> score_shift(p)) & kScoreMax;
  }
  return payoff;
}

}  // namespace core
