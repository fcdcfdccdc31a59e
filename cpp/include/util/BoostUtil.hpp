#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <memory>
#include <ostream>
#include <string>

namespace boost_util {

namespace program_options {

/*
 * po::value<float>(...)->default_value(...) prints the default value with undesirable precision.
 * This default_value() function provides a cleaner way to specify the displayed string. Usage:
 *
 * boost_util::program_options::default_value("{:.3f}", &f)
 */
template <typename T>
auto default_value(fmt::format_string<T&> fmt, T* dest) {
  std::string s = fmt::format(fmt, *dest);
  return boost::program_options::value<T>(dest)->default_value(*dest, s);
}

/*
 * This class is a thin wrapper around boost::program_options::options_description. The option
 * name is passed as a template argument rather than as a function argument, which allows a
 * chained style:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"foo", 'f'>(...)
 *     .add_option<"bar">(...)
 *     ;
 *
 * Copies share the underlying boost object, so the result of a chain can be returned by value.
 */
class options_description {
 public:
  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  options_description add_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options. The one that would be a no-op given the current value
   * of *flag is labeled as such in the --help output.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  options_description add_flag(bool* flag, const char* true_help, const char* false_help);

  // Adds all options from desc to this.
  options_description add(const options_description& desc);

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    return s << *desc.base_;
  }

  const base_t& get() const { return *base_; }

 private:
  std::shared_ptr<base_t> base_;
};

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc. Returns
 * the parsed variables_map. Parse errors are rethrown as util::CleanException.
 */
template <typename... Ts>
boost::program_options::variables_map parse_args(const options_description& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
