#pragma once

#include <algorithm>
#include <cstdint>
#include <type_traits>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Useful macro for constexpr-detection of whether a macro is assigned to 1. This is useful given
 * the behavior of the -D option passed through CMake.
 *
 * #define FOO 1
 * // #define BAR
 *
 * static_assert(IS_DEFINED(FOO))
 * static_assert(!IS_DEFINED(BAR))
 */
#define IS_DEFINED(macro) (XSTR(macro)[0] == '1')

/*
 * Marks the arguments as used without evaluating them. Used by the logging macros so that
 * compiled-out LOG_DEBUG() statements do not trigger unused-variable warnings.
 */
#define USE_UNEVALUATED(...)                    \
  do {                                          \
    if (false) {                                \
      util::detail::use_unevaluated(__VA_ARGS__); \
    }                                           \
  } while (0)

namespace util {

namespace detail {
template <typename... Ts>
void use_unevaluated(const Ts&...) {}
}  // namespace detail

int64_t constexpr inline ms_to_ns(int64_t ms) { return ms * 1000 * 1000; }

/*
 * Compile-time string, usable as a template argument:
 *
 * template <util::StringLiteral S> void foo() { std::cout << S.value; }
 * foo<"bar">();
 */
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }
  char value[N];
};

/*
 * This identity function is intended to be used to declare required members in concepts.
 *
 * Example usage:
 *
 * template <class T>
 * concept Foo = requires(T t) {
 *   { util::decay_copy(T::bar) } -> std::same_as<int>;
 * };
 */
template <class T>
std::decay_t<T> decay_copy(T&&);

}  // namespace util
