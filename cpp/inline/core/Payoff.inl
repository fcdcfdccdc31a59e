#include "core/Payoff.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace core {

template <int NumPlayers>
Payoff<NumPlayers>& Payoff<NumPlayers>::operator+=(const Payoff& other) {
  weight += other.weight;
  for (int p = 0; p < kNumPlayers; ++p) {
    scores[p] += other.scores[p];
  }
  return *this;
}

template <int NumPlayers>
Payoff<NumPlayers> Payoff<NumPlayers>::operator+(const Payoff& other) const {
  Payoff out = *this;
  out += other;
  return out;
}

template <int NumPlayers>
std::string Payoff<NumPlayers>::to_str() const {
  return fmt::format("[{}]@{}", fmt::join(scores, ", "), weight);
}

}  // namespace core
