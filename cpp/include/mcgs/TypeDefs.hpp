#pragma once

#include "util/AllocPool.hpp"

#include <chrono>
#include <cstdint>

namespace mcgs {

using vertex_index_t = util::pool_index_t;
using edge_index_t = util::pool_index_t;
constexpr util::pool_index_t kNullIndex = -1;

// Index of a search worker. Each worker owns one bit of every edge's traversal masks.
using worker_id_t = int8_t;

// Counts calls to Manager::run_round().
using epoch_t = uint32_t;

using time_point_t = std::chrono::time_point<std::chrono::steady_clock>;

}  // namespace mcgs
