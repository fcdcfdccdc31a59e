#include "mcgs/RandomSimulator.hpp"

#include "mcgs/SearchError.hpp"
#include "util/Random.hpp"

namespace mcgs {

template <core::concepts::Game Game>
typename Game::Payoff RandomSimulator<Game>::simulate(const State& start,
                                                      std::mt19937& prng) const {
  State state = start;
  while (true) {
    auto payoff = Rules::payoff_of(state);
    if (payoff) return *payoff;

    // reservoir-sample one legal action
    Action action;
    uint64_t num_actions = 0;
    Rules::for_each_action(state, [&](const Action& a) {
      if (util::Random::replace_with_probability(prng, ++num_actions)) {
        action = a;
      }
      return core::kContinue;
    });

    if (num_actions == 0) {
      throw SearchError(SearchError::kNoTerminalPayoff, "no legal actions and no payoff: {}",
                        IO::compact_state_repr(state));
    }
    Rules::apply(state, action);
  }
}

}  // namespace mcgs
