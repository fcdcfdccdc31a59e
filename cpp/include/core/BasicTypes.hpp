#pragma once

#include <cstdint>

namespace core {

using player_index_t = int8_t;

// Action type of games whose actions are small integer indices.
using action_t = int32_t;

// Returned by the callback passed to Rules::for_each_action(). kBreak requests that enumeration
// stop early.
enum loop_control_t : int8_t { kContinue, kBreak };

}  // namespace core
