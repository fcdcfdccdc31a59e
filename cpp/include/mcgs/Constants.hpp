#pragma once

#include "util/CppUtil.hpp"

namespace mcgs {

// Traversal marks are one bit per worker in a 64-bit mask.
constexpr int kMaxWorkers = 64;

constexpr int kThreadWhitespaceLength = 30;  // for debug printing alignment
constexpr bool kEnableSearchDebug = IS_DEFINED(MCGS_DEBUG);

}  // namespace mcgs
