#pragma once

#include <exception>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "to_string.hpp"

namespace genserver {
class GenServerError;

namespace traits {
// Message arguments, i.e., anything but a single GenServerError (which must copy instead)
template<typename ... ArgT>
struct is_message_args : public std::true_type {};

template<typename Arg>
struct is_message_args<Arg> :
  public std::negation<std::is_base_of<GenServerError, std::decay_t<Arg>>> {};
} // namespace traits

class GenServerError : public std::exception {
public:
  GenServerError() = default;

  GenServerError(const std::string& msg);
  GenServerError(std::string&& msg);

  template<typename ... ArgT,
    typename std::enable_if_t<traits::is_message_args<ArgT ...>::value>* = nullptr>
  GenServerError(ArgT&& ... args):
    GenServerError(to_string(std::forward<ArgT>(args) ...)) {
  }

  const char* what() const noexcept override;

private:
  std::string msg;
};

#define GENSERVER_DEFINE_ERROR(Error, Base)                   \
  class Error : public Base {                                 \
  public:                                                     \
    Error() = default;                                        \
    template<typename ... ArgT, typename std::enable_if_t<    \
      traits::is_message_args<ArgT ...>::value>* = nullptr>   \
    Error(ArgT&& ... args):                                   \
      Base(std::forward<ArgT>(args) ...) {                    \
    }                                                         \
  }

// cast / call on a server that is not Running
GENSERVER_DEFINE_ERROR(NotRunningError, GenServerError);
// ... because it has never been started
GENSERVER_DEFINE_ERROR(NotStartedError, NotRunningError);
// ... because it is stopping, stopped, or its worker loop has exited
GENSERVER_DEFINE_ERROR(StoppedError, NotRunningError);
GENSERVER_DEFINE_ERROR(AlreadyStartedError, GenServerError);
GENSERVER_DEFINE_ERROR(InitFailedError, GenServerError);
GENSERVER_DEFINE_ERROR(GenServerTimeoutError, GenServerError);
GENSERVER_DEFINE_ERROR(NotImplementedError, GenServerError);

#undef GENSERVER_DEFINE_ERROR

// Thrown on the caller's thread when handle_call throws on the worker.
// The original exception is attached as the nested exception.
class CallbackError : public GenServerError {
public:
  CallbackError() = default;

  template<typename ... ArgT,
    typename std::enable_if_t<traits::is_message_args<ArgT ...>::value>* = nullptr>
  CallbackError(ArgT&& ... args):
    GenServerError(std::forward<ArgT>(args) ...) {
  }

  // The exception thrown by the callback, or nullptr if none is attached.
  std::exception_ptr cause() const noexcept;
};

// Wrap the exception currently being handled into `Error` (as its nested exception).
// Must be called inside a catch block.
template<typename Error, typename ... ArgT>
std::exception_ptr make_nested_exception_ptr(ArgT&& ... args) {
  try {
    std::throw_with_nested(Error(std::forward<ArgT>(args) ...));
  } catch (...) {
    return std::current_exception();
  }
}

void print_exception(std::ostream& o, const std::exception& e, int level = 0);

// Render an exception (and its nested chain) for logging.
std::string describe_exception(const std::exception_ptr& e);
} // namespace genserver
