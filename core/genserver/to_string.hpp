#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace genserver {
namespace impl {
inline void to_string(std::ostringstream&) {}

template<typename Arg, typename ... ArgT>
inline void to_string(std::ostringstream& oss, Arg&& arg, ArgT&& ... args) {
  oss << std::forward<Arg>(arg);
  to_string(oss, std::forward<ArgT>(args) ...);
}
} // namespace impl

// Concatenate anything streamable, e.g., to_string("server ", id, " failed")
template<typename ... ArgT>
std::string to_string(ArgT&& ... args) {
  std::ostringstream oss;
  impl::to_string(oss, std::forward<ArgT>(args) ...);
  return oss.str();
}
} // namespace genserver
