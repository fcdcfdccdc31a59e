#pragma once

#include "util/CppUtil.hpp"

#include <concepts>

namespace core {
namespace concepts {

template <class GC>
concept GameConstants = requires {
  // kNumPlayers is the number of players in the game.
  { util::decay_copy(GC::kNumPlayers) } -> std::same_as<int>;

  // Used in logging and in the --help output of executables.
  { util::decay_copy(GC::kGameName) } -> std::same_as<const char*>;
};

}  // namespace concepts
}  // namespace core
