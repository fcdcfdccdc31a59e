#include "util/GTestUtil.hpp"

#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

// testing::InitGoogleTest() strips the --gtest_* arguments it recognizes from argv, so it runs
// first. Our own options are then parsed from what remains.
int launch_gtest(int argc, char** argv) {
  namespace po2 = boost_util::program_options;
  util::Logging::Params log_params;
  util::Random::Params random_params;
  log_params.log_level = "warn";

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.add(log_params.make_options_description())
                .add(random_params.make_options_description());

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      std::cout << desc << std::endl;
    }
  }

  testing::InitGoogleTest(&argc, argv);

  po2::parse_args(desc, argc, argv);
  util::Logging::init(log_params);
  util::Random::init(random_params);
  return RUN_ALL_TESTS();
}
