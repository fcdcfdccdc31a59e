#include "mcgs/ManagerParams.hpp"

#include "mcgs/Constants.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/erase.hpp>
#include <magic_enum/magic_enum.hpp>

namespace mcgs {

namespace detail {

// Maps "visit-count" to kVisitCount, "prune" to kPrune, and so on.
template <typename Enum>
Enum parse_option_enum(const std::string& option, const std::string& str) {
  for (auto [value, name] : magic_enum::enum_entries<Enum>()) {
    std::string candidate(name.substr(1));  // drop the leading 'k'
    std::string normalized = boost::algorithm::to_lower_copy(str);
    boost::algorithm::erase_all(normalized, "-");
    if (boost::algorithm::to_lower_copy(candidate) == normalized) return value;
  }
  throw util::CleanException("Invalid --{}: {}", option, str);
}

}  // namespace detail

inline auto ManagerParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Manager options");

  return desc
    .template add_option<"num-iterations", 'i'>(
      po::value<int>(&num_iterations)->default_value(num_iterations), "rollouts per search round")
    .template add_option<"simulation-count", 's'>(
      po::value<int>(&simulation_count)->default_value(simulation_count),
      "random playouts per newly expanded vertex")
    .template add_option<"explore-bias", 'b'>(po2::default_value("{:.2f}", &explore_bias),
                                              "UCB1 exploration bias")
    .template add_option<"num-search-threads", 'n'>(
      po::value<int>(&num_search_threads)->default_value(num_search_threads),
      "num search threads")
    .template add_option<"search-time-limit-ms">(
      po::value<int>(&search_time_limit_ms)->default_value(search_time_limit_ms),
      "wall-clock limit per search round (0 = none)")
    .template add_option<"graph-compaction">(
      po::value<std::string>(&graph_compaction_str)->default_value(graph_compaction_str),
      "what to do with the search graph after each move: prune|clear|retain")
    .template add_option<"action-select">(
      po::value<std::string>(&action_select_str)->default_value(action_select_str),
      "how to choose the move to play: ucb|visit-count");
}

inline ManagerParams::graph_compaction_t ManagerParams::graph_compaction() const {
  return detail::parse_option_enum<graph_compaction_t>("graph-compaction", graph_compaction_str);
}

inline ManagerParams::action_select_t ManagerParams::action_select() const {
  return detail::parse_option_enum<action_select_t>("action-select", action_select_str);
}

}  // namespace mcgs
