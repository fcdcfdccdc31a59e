#include "mcgs/UcbSelector.hpp"

#include "mcgs/SearchError.hpp"
#include "util/Asserts.hpp"
#include "util/Random.hpp"

#include <fmt/format.h>

#include <cmath>
#include <limits>

namespace mcgs {

inline std::string UcbResult::to_str() const {
  switch (kind) {
    case kSelect:
      return "select";
    case kValue:
      return fmt::format("{:.4f}", value);
    default:
      return "invalid";
  }
}

template <core::concepts::Game Game>
UcbSelector<Game>::UcbSelector(const SearchGraph& graph, vertex_index_t v, double explore_bias)
    : player(graph.vertex(v).active_player), edges_(graph.children(v)) {
  int n = edges_.size();
  N.resize(n);
  Q.resize(n);
  mask.resize(n);

  for (int i = 0; i < n; ++i) {
    const Edge& edge = graph.edge(edges_[i]);
    auto payoff = edge.stats.as_payoff();  // one atomic read, so N and Q are consistent
    N(i) = payoff.weight;
    Q(i) = payoff.score(player);

    auto target = edge.target();
    bool cyclic = target.kind == Edge::kCycle ||
                  (target.kind == Edge::kExpanded && graph.vertex(target.vertex).is_cyclic());
    mask(i) = (cyclic && N(i) > 0) ? 0 : 1;  // unvisited children stay selectable
  }

  if (n > 0 && (mask == 0).all()) {
    mask.setConstant(1);  // if all children are masked out, unmask all children
  }

  double parent_visits = N.sum();
  double log_parent_visits = parent_visits > 0 ? std::log(parent_visits) : 0;
  constexpr double kInf = std::numeric_limits<double>::infinity();

  Array raw = Q / N + explore_bias * (log_parent_visits / N).sqrt();
  UCB = (N == 0).select(Array::Constant(n, kInf), raw);
}

template <core::concepts::Game Game>
int UcbSelector<Game>::select(std::mt19937& prng) const {
  RELEASE_ASSERT(num_children() > 0, "select() called on a childless vertex");

  int choice = -1;
  double best = 0;
  uint64_t num_ties = 0;
  for (int i = 0; i < num_children(); ++i) {
    if (!mask(i)) continue;
    check_valid(i);
    double u = UCB(i);
    if (choice < 0 || u > best) {
      choice = i;
      best = u;
      num_ties = 1;
    } else if (u == best) {
      ++num_ties;
      if (util::Random::replace_with_probability(prng, num_ties)) {
        choice = i;
      }
    }
  }
  return choice;
}

template <core::concepts::Game Game>
bool UcbSelector<Game>::is_best_child(edge_index_t e) const {
  int k = index_of(e);
  if (!mask(k)) return false;
  if (N(k) == 0) return true;

  double best = -std::numeric_limits<double>::infinity();
  for (int i = 0; i < num_children(); ++i) {
    if (!mask(i)) continue;
    if (N(i) == 0) return false;  // an unvisited sibling is the only best child
    check_valid(i);
    best = std::max(best, UCB(i));
  }
  return UCB(k) >= best;
}

template <core::concepts::Game Game>
UcbResult UcbSelector<Game>::result(int i) const {
  if (N(i) == 0) return UcbResult{UcbResult::kSelect, 0};
  if (std::isnan(UCB(i))) return UcbResult{UcbResult::kInvalid, 0};
  return UcbResult{UcbResult::kValue, UCB(i)};
}

template <core::concepts::Game Game>
int UcbSelector<Game>::index_of(edge_index_t e) const {
  for (int i = 0; i < num_children(); ++i) {
    if (edges_[i] == e) return i;
  }
  RELEASE_ASSERT(false, "edge {} is not a child of the selector's vertex", e);
  return -1;
}

template <core::concepts::Game Game>
void UcbSelector<Game>::check_valid(int i) const {
  if (std::isnan(UCB(i))) {
    throw SearchError(SearchError::kSelector, "invalid UCB comparison for edge {} (N={} Q={})",
                      edges_[i], N(i), Q(i));
  }
}

}  // namespace mcgs
