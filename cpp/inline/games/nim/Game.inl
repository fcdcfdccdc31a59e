#include "games/nim/Game.hpp"

#include "util/Asserts.hpp"

#include <boost/functional/hash.hpp>
#include <fmt/format.h>

namespace nim {

inline size_t Game::State::hash() const {
  size_t seed = 0;
  boost::hash_combine(seed, stones_left);
  boost::hash_combine(seed, current_player);
  return seed;
}

inline void Game::Rules::init_state(State& state) {
  state.stones_left = nim::kStartingStones;
  state.current_player = 0;
}

inline core::player_index_t Game::Rules::get_current_player(const State& state) {
  return state.current_player;
}

template <typename F>
void Game::Rules::for_each_action(const State& state, F&& f) {
  for (Action action = 0; action < nim::kMaxStonesToTake; ++action) {
    if (action + 1 > state.stones_left) return;
    if (f(action) == core::kBreak) return;
  }
}

inline void Game::Rules::apply(State& state, Action action) {
  RELEASE_ASSERT(action >= 0 && action < nim::kMaxStonesToTake, "Invalid action: {}", action);
  RELEASE_ASSERT(action + 1 <= state.stones_left, "Cannot take {} of {} stones", action + 1,
                 state.stones_left);

  state.stones_left -= action + 1;
  state.current_player = 1 - state.current_player;
}

inline std::optional<Game::Payoff> Game::Rules::payoff_of(const State& state) {
  if (state.stones_left > 0) return std::nullopt;

  int last_player = 1 - state.current_player;
  Payoff::score_array_t scores;
  scores[last_player] = kWinScore;
  scores[1 - last_player] = kLossScore;
  return Payoff::outcome(scores);
}

inline std::string Game::IO::action_to_str(Action action) { return std::to_string(action + 1); }

inline void Game::IO::print_state(std::ostream& os, const State& state) {
  os << compact_state_repr(state) << std::endl;
}

inline std::string Game::IO::compact_state_repr(const State& state) {
  return fmt::format("[{}, {}]", state.stones_left, state.current_player);
}

}  // namespace nim
