#pragma once

#include <cstdint>
#include <string>

namespace mcgs {

/*
 * ManagerParams pertains to a single mcgs::Manager instance.
 */
struct ManagerParams {
  // What commit_action() does to the graph once the root advances.
  enum graph_compaction_t : int8_t {
    kPrune,   // drop everything not reachable from the new root
    kClear,   // drop everything
    kRetain   // keep everything
  };

  // How select_action() picks among the root's children.
  enum action_select_t : int8_t { kUcb, kVisitCount };

  auto make_options_description();
  bool operator==(const ManagerParams& other) const = default;

  graph_compaction_t graph_compaction() const;
  action_select_t action_select() const;

  int num_iterations = 1000;  // rollouts per run_round() call
  int simulation_count = 1;   // playouts per freshly expanded vertex
  float explore_bias = 0.64;
  int num_search_threads = 1;

  // If positive, run_round() also stops once this much wall-clock time has elapsed.
  int search_time_limit_ms = 0;

  std::string graph_compaction_str = "prune";
  std::string action_select_str = "visit-count";
};

}  // namespace mcgs

#include "inline/mcgs/ManagerParams.inl"
