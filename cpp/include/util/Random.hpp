#pragma once

#include <concepts>
#include <cstdint>
#include <random>

/*
 * Process-wide randomness for the search.
 *
 * Every search thread owns a std::mt19937, seeded from derive_seed(), so that the hot path never
 * locks. The seeds are drawn from a default prng, which is seeded with the current time unless
 * --seed is passed:
 *
 * util::Random::Params random_params;
 * ... add random_params.make_options_description() to the cmdline options and parse ...
 * util::Random::init(random_params);
 *
 * With a fixed seed and a single search thread, a search is fully reproducible.
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper). Throws util::Exception
   * if the range is empty.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  /*
   * Reservoir-sampling step: returns true with probability 1/n. Calling this for the k-th of n
   * equally-ranked candidates, and keeping the candidate when it returns true, leaves each of them
   * selected with probability 1/n.
   */
  static bool replace_with_probability(std::mt19937& prng, uint64_t n);

  // Returns a fresh seed drawn from the default prng. Thread-safe.
  static uint32_t derive_seed();

 private:
  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
