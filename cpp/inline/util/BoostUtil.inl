#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

namespace boost_util {

namespace program_options {

inline options_description::options_description(const char* name)
    : base_(std::make_shared<base_t>(name)) {}

template <util::StringLiteral StrLit, char Char, typename... Ts>
options_description options_description::add_option(Ts&&... ts) {
  std::string full_name(StrLit.value);
  if (Char != ' ') {
    full_name = fmt::format("{},{}", full_name, Char);
  }
  base_->add_options()(full_name.c_str(), std::forward<Ts>(ts)...);
  return *this;
}

template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
options_description options_description::add_flag(bool* flag, const char* true_help,
                                                  const char* false_help) {
  namespace po = boost::program_options;

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;

  if (*flag) {
    full_true_help += " (no-op)";
  } else {
    full_false_help += " (no-op)";
  }

  base_->add_options()(TrueStrLit.value, po::value(flag)->implicit_value(true)->zero_tokens(),
                       full_true_help.c_str())(
    FalseStrLit.value, po::value(flag)->implicit_value(false)->zero_tokens(),
    full_false_help.c_str());
  return *this;
}

inline options_description options_description::add(const options_description& desc) {
  base_->add(*desc.base_);
  return *this;
}

template <typename... Ts>
boost::program_options::variables_map parse_args(const options_description& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(desc.get()).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
