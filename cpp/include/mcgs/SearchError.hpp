#pragma once

#include "mcgs/TypeDefs.hpp"
#include "util/Exception.hpp"

#include <cstdint>
#include <vector>

namespace mcgs {

/*
 * Errors surfaced by the search. Structural defects inside the graph (bad indices, missing
 * vertices) are not SearchError's; they fail a RELEASE_ASSERT() or DEBUG_ASSERT() instead.
 *
 * kNoRootState: the root state has no vertex. Recover by calling Manager::initialize().
 *
 * kCycle: a rollout pass re-entered an edge it had already traversed. Thrown as a CycleError and
 * handled inside the search thread, which discards the pass.
 *
 * kNoTerminalPayoff: a state without legal actions reported no payoff. This points at an
 * inconsistent Game implementation.
 *
 * kSelector: a selection, backprop or simulation strategy failed, e.g. on a NaN comparison. The
 * round is aborted but the graph remains valid.
 */
class SearchError : public util::Exception {
 public:
  enum kind_t : int8_t { kNoRootState, kCycle, kNoTerminalPayoff, kSelector };

  template <typename... Ts>
  SearchError(kind_t kind, fmt::format_string<Ts...> fmt, Ts&&... ts)
      : util::Exception(fmt, std::forward<Ts>(ts)...), kind_(kind) {}

  kind_t kind() const { return kind_; }

 private:
  kind_t kind_;
};

class CycleError : public SearchError {
 public:
  CycleError(const std::vector<edge_index_t>& path, edge_index_t repeated_edge)
      : SearchError(kCycle, "cycle at edge {} after {} steps", repeated_edge, path.size()),
        path_(path),
        repeated_edge_(repeated_edge) {}

  // The rollout path up to, but excluding, the repeated edge.
  const std::vector<edge_index_t>& path() const { return path_; }
  edge_index_t repeated_edge() const { return repeated_edge_; }

 private:
  std::vector<edge_index_t> path_;
  edge_index_t repeated_edge_;
};

}  // namespace mcgs
