#pragma once

#include "core/BasicTypes.hpp"
#include "core/Payoff.hpp"
#include "core/Statistics.hpp"
#include "core/concepts/Game.hpp"
#include "games/tictactoe/Constants.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace tictactoe {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

/*
 * Bit order encoding for the board:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 *
 * An action is the index of the cell to place a piece on.
 */
class Game {
 public:
  struct Constants {
    static constexpr const char* kGameName = "tictactoe";
    static constexpr int kNumPlayers = tictactoe::kNumPlayers;
  };

  struct State {
    auto operator<=>(const State& other) const = default;
    size_t hash() const;
    mask_t opponent_mask() const { return full_mask ^ cur_player_mask; }
    core::player_index_t get_player_at(int row, int col) const;

    mask_t full_mask = 0;        // spaces occupied by either player
    mask_t cur_player_mask = 0;  // spaces occupied by current player
  };

  using Action = core::action_t;
  using Payoff = core::Payoff<kNumPlayers>;
  using Statistics = core::Statistics<kNumPlayers>;

  struct Rules {
    static void init_state(State&);
    static core::player_index_t get_current_player(const State&);

    template <typename F>
    static void for_each_action(const State&, F&& f);

    static void apply(State&, Action action);
    static std::optional<Payoff> payoff_of(const State&);
  };

  struct IO {
    static std::string action_to_str(Action action) { return std::to_string(action); }
    static std::string player_to_str(core::player_index_t player) {
      return (player == tictactoe::kX) ? "X" : "O";
    }
    static void print_state(std::ostream&, const State&);
    static std::string compact_state_repr(const State& state);
  };

  static constexpr mask_t kThreeInARowMasks[] = {
    make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
    make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};
};

}  // namespace tictactoe

namespace std {

template <>
struct hash<tictactoe::Game::State> {
  size_t operator()(const tictactoe::Game::State& pos) const { return pos.hash(); }
};

}  // namespace std

static_assert(core::concepts::Game<tictactoe::Game>);

#include "inline/games/tictactoe/Game.inl"
