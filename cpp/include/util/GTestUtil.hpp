#pragma once

#include <gtest/gtest.h>

/*
 * Replacement for gtest's main(). Besides the --gtest_* flags, accepts the util::Logging options
 * (default level: warn) and the util::Random options. A test binary's main() is just:
 *
 * int main(int argc, char** argv) { return launch_gtest(argc, argv); }
 */
int launch_gtest(int argc, char** argv);
