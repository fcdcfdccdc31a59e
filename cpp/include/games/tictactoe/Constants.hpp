#pragma once

#include "core/BasicTypes.hpp"

#include <cstdint>

namespace tictactoe {

using mask_t = uint16_t;
const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;
const int kNumPlayers = 2;

const core::player_index_t kX = 0;
const core::player_index_t kO = 1;

// Final scores
const uint32_t kWinScore = 2;
const uint32_t kDrawScore = 1;
const uint32_t kLossScore = 0;

}  // namespace tictactoe
