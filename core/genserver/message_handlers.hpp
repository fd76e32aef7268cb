#pragma once

#include <memory>
#include <unordered_map>
#include <utility>

#include "callable_signature.hpp"
#include "genserver_exception.hpp"
#include "message.hpp"
#include "traits.hpp"

namespace genserver {
// Store the type-erased user-defined message handler
struct MessageHandler {
  virtual void process(const Message& m) = 0;

  virtual ~MessageHandler() = default;
};

// Recover the argument types of the message from the signature of the handler,
// then forward the arguments into the handler.
// Handler arguments are passed as const lvalues, so take them by value or by const reference.
template<typename Handler>
class TypedMessageHandler : public MessageHandler {
private:
  Handler handler;
  using ArgTypes = typename traits::is_callable<Handler>::args_t;

public:
  template<typename H>
  TypedMessageHandler(H&& handler): handler(std::forward<H>(handler)) {
    static_assert(traits::is_callable<Handler>::value,
      " Not an acceptable handler.");
  }

  void process(const Message& m) override {
    // no `auto` is allowed in the argument type, otherwise we need to
    // match the lambda with arguments in compile time.
    process(m, std::make_index_sequence<ArgTypes::size>());
  }

private:
  template<size_t ... I>
  inline void process(const Message& m, std::index_sequence<I ...>) {
    using Content = typename ArgTypes::template decay_apply_t<std::tuple>;
    auto& content = as_content(m, static_cast<Content*>(nullptr));
    handler(std::get<I>(content) ...);
  }

  template<typename ... T>
  inline static const std::tuple<T ...>& as_content(const Message& m, std::tuple<T ...>*) {
    return m.as<T ...>();
  }
};

// create a pair that links the code with the user_handler
// while the type of the user_handler is erased.
template<typename Handler>
inline auto operator-(Code code, Handler&& user_handler) {
  using HandlerX = traits::remove_cvref_t<Handler>;
  return std::make_pair(code.value, std::unique_ptr<MessageHandler>(
    new TypedMessageHandler<HandlerX>(std::forward<Handler>(user_handler))));
}

/**
 * Dispatch a Message to the handler registered for its code, e.g.,
 *
 *   MessageHandlers handlers{
 *     Code{0} - [&](int delta) { ... },
 *     Code{1} - [&](const std::string& key, int value) { ... }
 *   };
 *   handlers.process(message);
 **/
class MessageHandlers {
public:
  template<typename ... ArgT>
  MessageHandlers(ArgT&& ... args) {
    add_handlers(std::forward<ArgT>(args) ...);
  }

  MessageHandlers(MessageHandlers&& other);
  MessageHandlers& operator=(MessageHandlers&& other);

  // Return false if no handler is registered for the code of `m`
  bool try_process(const Message& m);

  // Throw NotImplementedError if no handler is registered for the code of `m`
  void process(const Message& m);

  template<typename CodeHandler, typename ... ArgT>
  void add_handlers(CodeHandler&& code_handler, ArgT&& ... args) {
    auto code = code_handler.first;
    if (!handlers.emplace(std::move(code_handler)).second) {
      throw GenServerError("Message handler code conflicts with a previous "
        "handler. Code: ", code);
    }
    add_handlers(std::forward<ArgT>(args) ...);
  }

  void add_handlers();

  bool contains(Code code) const;

  size_t size() const;

private:
  std::unordered_map<size_t, std::unique_ptr<MessageHandler>> handlers;
};
} // namespace genserver
