#pragma once

#include "core/BasicTypes.hpp"

#include <cstdint>

namespace nim {

const int kNumPlayers = 2;
const int kMaxStonesToTake = 3;
const int kStartingStones = 21;

// Action i takes i+1 stones.
const core::action_t kTake1 = 0;
const core::action_t kTake2 = 1;
const core::action_t kTake3 = 2;

// Final scores. Whoever takes the last stone wins.
const uint32_t kWinScore = 1;
const uint32_t kLossScore = 0;

}  // namespace nim
