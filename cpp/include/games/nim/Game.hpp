#pragma once

#include "core/BasicTypes.hpp"
#include "core/Payoff.hpp"
#include "core/Statistics.hpp"
#include "core/concepts/Game.hpp"
#include "games/nim/Constants.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace nim {

struct Game {
  struct Constants {
    static constexpr const char* kGameName = "nim";
    static constexpr int kNumPlayers = nim::kNumPlayers;
  };

  struct State {
    auto operator<=>(const State& other) const = default;
    size_t hash() const;

    int stones_left = kStartingStones;
    int current_player = 0;
  };

  using Action = core::action_t;
  using Payoff = core::Payoff<kNumPlayers>;
  using Statistics = core::Statistics<kNumPlayers>;

  struct Rules {
    static void init_state(State& state);
    static core::player_index_t get_current_player(const State& state);

    template <typename F>
    static void for_each_action(const State& state, F&& f);

    static void apply(State& state, Action action);
    static std::optional<Payoff> payoff_of(const State& state);
  };

  struct IO {
    static std::string action_to_str(Action action);
    static void print_state(std::ostream& os, const State& state);
    static std::string compact_state_repr(const State& state);
  };
};  // struct Game

}  // namespace nim

namespace std {

template <>
struct hash<nim::Game::State> {
  size_t operator()(const nim::Game::State& pos) const { return pos.hash(); }
};

}  // namespace std

static_assert(core::concepts::Game<nim::Game>);

#include "inline/games/nim/Game.inl"
