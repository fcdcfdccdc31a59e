#include "mcgs/SearchResults.hpp"

#include <fmt/format.h>

namespace mcgs {

inline RoundStats& RoundStats::operator+=(const RoundStats& other) {
  iterations += other.iterations;
  expansions += other.expansions;
  transpositions += other.transpositions;
  cycles += other.cycles;
  collisions += other.collisions;
  simulations += other.simulations;
  return *this;
}

inline std::string RoundStats::to_str() const {
  return fmt::format(
    "iterations={} expansions={} transpositions={} cycles={} collisions={} simulations={}",
    iterations, expansions, transpositions, cycles, collisions, simulations);
}

template <core::concepts::Game Game>
std::string SearchResults<Game>::to_str() const {
  std::string s = fmt::format("epoch={} root_visits={} player={}\n", epoch, root_visits,
                              active_player);
  s += fmt::format("{:>8} {:>8} {:>8} {:>10}  {}\n", "action", "visits", "avg", "ucb", "payoff");
  for (const auto& entry : actions) {
    double avg = entry.payoff.weight ? 1.0 * entry.payoff.score(active_player) / entry.payoff.weight
                                     : 0.0;
    s += fmt::format("{:>8} {:>8} {:>8.3f} {:>10}  {}\n", Game::IO::action_to_str(entry.action),
                     entry.payoff.weight, avg, entry.ucb.to_str(), entry.payoff.to_str());
  }
  s += stats.to_str();
  return s;
}

}  // namespace mcgs
