#include "util/Random.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

#include <ctime>
#include <mutex>

namespace util {

inline auto Random::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Random options");

  return desc.template add_option<"seed">(po::value<int>(&seed)->default_value(seed),
                                          "seed for search threads (0 means seed with time)");
}

inline void Random::init(const Params& params) {
  if (params.seed) {
    default_prng().seed(params.seed);
  }
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  if (lower >= upper) {
    throw util::Exception("Random::uniform_sample() - invalid range [{}, {})", lower, upper);
  }
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

inline bool Random::replace_with_probability(std::mt19937& prng, uint64_t n) {
  if (n <= 1) return true;
  return uniform_sample(prng, uint64_t(0), n) == 0;
}

inline uint32_t Random::derive_seed() {
  static std::mutex mutex;
  std::unique_lock lock(mutex);
  return default_prng()();
}

inline std::mt19937& Random::default_prng() {
  static std::mt19937 prng(std::time(nullptr));
  return prng;
}

}  // namespace util
