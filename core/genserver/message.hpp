#pragma once

#include <cstddef>
#include <memory>
#include <ostream>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "genserver_exception.hpp"

namespace genserver {
struct Code {
  size_t value = 0;

  Code() = default;
  constexpr Code(size_t value) : value(value) {}

  inline operator size_t() const {
    return value;
  }
};

class MessageBody {
public:
  virtual size_t size() const = 0;
  virtual const std::type_info& get_content_type() const = 0;

  virtual ~MessageBody() = default;
};

// The content of a Message, i.e., a tuple of decayed argument types
template<typename ... ArgT>
class TypedMessageBody : public MessageBody {
public:
  using Content = std::tuple<ArgT ...>;

  template<typename ... U>
  explicit TypedMessageBody(U&& ... args):
    content(std::forward<U>(args) ...) {
  }

  size_t size() const override {
    return sizeof ... (ArgT);
  }

  const std::type_info& get_content_type() const override {
    return typeid(Content);
  }

  const Content& get_content() const {
    return content;
  }

private:
  const Content content;
};

/**
 * An open structured message: a code telling what the message is about,
 * and an immutable list of arguments of any (copyable or movable) types.
 * The arguments are shared among the copies of a message, so passing a message
 * across threads never copies its content.
 **/
class Message {
public:
  Message();

  template<typename ... ArgT>
  explicit Message(Code code, ArgT&& ... args):
    code(code),
    body(std::make_shared<TypedMessageBody<std::decay_t<ArgT> ...>>(
      std::forward<ArgT>(args) ...)) {
  }

  Code get_code() const;

  // the number of arguments
  size_t size() const;

  // whether the arguments are exactly of types T ... (decayed)
  template<typename ... T>
  bool holds() const {
    return body->get_content_type() == typeid(std::tuple<std::decay_t<T> ...>);
  }

  // all the arguments, typed
  template<typename ... T>
  const std::tuple<T ...>& as() const {
    auto typed = dynamic_cast<const TypedMessageBody<T ...>*>(body.get());
    if (!typed) {
      throw GenServerError("The content types of message with code ", code.value,
        " do not match. Expected: ", typeid(std::tuple<T ...>).name(),
        " Actual: ", body->get_content_type().name());
    }
    return typed->get_content();
  }

  // the only argument, typed
  template<typename T>
  const T& get() const {
    return std::get<0>(as<T>());
  }

  friend std::ostream& operator<<(std::ostream& out, const Message& m);

private:
  Code code{0};
  std::shared_ptr<const MessageBody> body;
};
} // namespace genserver
