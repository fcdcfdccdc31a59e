#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <cstdint>
#include <string>

namespace core {
namespace concepts {

/*
 * A Payoff is an accumulable score: a weight (the number of observations folded into it) plus a
 * fixed-size per-player score.
 */
template <class P>
concept Payoff = requires(P& p, const P& const_p, core::player_index_t player) {
  requires std::is_trivially_copyable_v<P>;
  requires std::equality_comparable<P>;
  { P::zero() } -> std::same_as<P>;
  { p += const_p } -> std::same_as<P&>;
  { const_p.weight } -> std::convertible_to<uint32_t>;
  { const_p.score(player) } -> std::convertible_to<double>;
  { const_p.to_str() } -> std::same_as<std::string>;
};

/*
 * A Statistics object is an atomically mutable accumulator of Payoff values. increment() must be
 * safe to call concurrently with other increment() and read calls.
 */
template <class S, class P>
concept Statistics = requires(S& s, const S& const_s, const P& payoff,
                              core::player_index_t player) {
  requires std::is_default_constructible_v<S>;
  requires std::is_trivially_destructible_v<S>;
  requires std::is_copy_assignable_v<S>;
  { const_s.visits() } -> std::convertible_to<uint32_t>;
  { const_s.score(player) } -> std::convertible_to<double>;
  { s.increment(payoff) };
  { s.store(payoff) };
  { const_s.as_payoff() } -> std::same_as<P>;
};

}  // namespace concepts
}  // namespace core
