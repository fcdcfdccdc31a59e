#include "games/tictactoe/Game.hpp"

#include "util/Asserts.hpp"

#include <bit>

namespace tictactoe {

void Game::Rules::apply(State& state, Action action) {
  RELEASE_ASSERT(action >= 0 && action < kNumCells, "invalid action {}", action);
  mask_t piece_mask = mask_t(1) << action;
  RELEASE_ASSERT(!(state.full_mask & piece_mask), "cell {} is occupied", action);

  state.cur_player_mask ^= state.full_mask;
  state.full_mask |= piece_mask;
}

std::optional<Game::Payoff> Game::Rules::payoff_of(const State& state) {
  core::player_index_t last_player = 1 - get_current_player(state);
  mask_t last_player_mask = state.opponent_mask();

  for (mask_t mask : kThreeInARowMasks) {
    if ((mask & last_player_mask) == mask) {
      Payoff::score_array_t scores;
      scores[last_player] = kWinScore;
      scores[1 - last_player] = kLossScore;
      return Payoff::outcome(scores);
    }
  }

  if (std::popcount(state.full_mask) == kNumCells) {
    return Payoff::outcome({kDrawScore, kDrawScore});
  }
  return std::nullopt;
}

void Game::IO::print_state(std::ostream& ss, const State& state) {
  auto cp = Rules::get_current_player(state);
  mask_t opp_player_mask = state.opponent_mask();
  mask_t o_mask = (cp == kO) ? state.cur_player_mask : opp_player_mask;
  mask_t x_mask = (cp == kX) ? state.cur_player_mask : opp_player_mask;

  char text[] =
      "0 1 2  | | | |\n"
      "3 4 5  | | | |\n"
      "6 7 8  | | | |\n";

  int offset_table[] = {8, 10, 12, 23, 25, 27, 38, 40, 42};
  for (int i = 0; i < kNumCells; ++i) {
    int offset = offset_table[i];
    if (o_mask & (mask_t(1) << i)) {
      text[offset] = 'O';
    } else if (x_mask & (mask_t(1) << i)) {
      text[offset] = 'X';
    }
  }

  ss << text << std::endl;
}

}  // namespace tictactoe
