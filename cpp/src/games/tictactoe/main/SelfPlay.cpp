/*
 * Plays one game of tictactoe in which both sides are driven by the same mcgs::Manager.
 */

#include "games/tictactoe/Game.hpp"
#include "mcgs/Manager.hpp"
#include "mcgs/ManagerParams.hpp"
#include "mcgs/SearchError.hpp"
#include "mcgs/Traits.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace {

using Game = tictactoe::Game;
using Traits = mcgs::Traits<Game>;
using Manager = mcgs::Manager<Traits>;

struct Args {
  auto make_options_description();

  bool show_results = true;
};

auto Args::make_options_description() {
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");

  return desc.template add_flag<"show-results", "hide-results">(
    &show_results, "print the per-action search report after every move",
    "only print the board after every move");
}

void play_game(const mcgs::ManagerParams& manager_params, const Args& args) {
  Manager manager(manager_params);

  Game::State state;
  Game::Rules::init_state(state);
  manager.initialize(state);

  while (!Game::Rules::payoff_of(state).has_value()) {
    auto results = manager.run_round(state);
    auto action = manager.select_action(results);

    core::player_index_t player = Game::Rules::get_current_player(state);
    if (args.show_results) {
      std::cout << results.to_str() << std::endl;
    }
    std::cout << Game::IO::player_to_str(player) << " plays " << Game::IO::action_to_str(action)
              << std::endl;

    manager.commit_action(action);
    Game::Rules::apply(state, action);

    std::ostringstream ss;
    Game::IO::print_state(ss, state);
    std::cout << ss.str();
  }

  auto payoff = *Game::Rules::payoff_of(state);
  std::cout << "Final payoff: " << payoff.to_str() << std::endl;
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    mcgs::ManagerParams manager_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help")
                  .add(args.make_options_description())
                  .add(manager_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    LOG_INFO("Starting {} self-play: iterations={} threads={} explore-bias={:.2f}",
             Game::Constants::kGameName, manager_params.num_iterations,
             manager_params.num_search_threads, manager_params.explore_bias);

    play_game(manager_params, args);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const mcgs::SearchError& e) {
    LOG_ERROR("Search failed: {}", e.what());
    return 1;
  }

  return 0;
}
