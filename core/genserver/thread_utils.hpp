#pragma once

#include <string>

#include <pthread.h>

#include "genserver_exception.hpp"
#include "macros.hpp"

namespace genserver {
namespace thread {

inline std::string get_name() {
  std::string name;
  name.resize(MaxThreadNameLen + 1);
  auto rc = pthread_getname_np(pthread_self(), name.data(), name.size());
  if (rc != 0) {
    throw GenServerError("Failed to get name of current thread. Error: ", rc);
  }
  auto end = name.find('\0');
  if (end != std::string::npos) {
    name.resize(end);
  }
  return name;
}

inline void set_name(const std::string& t_name) {
  if (t_name.size() > MaxThreadNameLen) {
    throw GenServerError(t_name, " is too long. Thread name in linux is not "
      "allowed to be larger than 16, including the terminaing null byte.");
  }
  auto old_t_name = get_name();
#ifdef __APPLE__
  auto rc = pthread_setname_np(t_name.c_str());
#else
  auto rc = pthread_setname_np(pthread_self(), t_name.c_str());
#endif
  if (rc != 0) {
    throw GenServerError("Failed to set the name of thread ", old_t_name,
      " to ", t_name, ". Error: ", rc);
  }
}
} // namespace thread
} // namespace genserver
