#include "genserver/message_handlers.hpp"

namespace genserver {
MessageHandlers::MessageHandlers(MessageHandlers&& other):
  handlers(std::move(other.handlers)) {
}

MessageHandlers& MessageHandlers::operator=(MessageHandlers&& other) {
  this->handlers = std::move(other.handlers);
  return *this;
}

bool MessageHandlers::try_process(const Message& m) {
  auto iter = handlers.find(m.get_code());
  if (iter == handlers.end()) {
    return false;
  }
  iter->second->process(m);
  return true;
}

void MessageHandlers::process(const Message& m) {
  if (!try_process(m)) {
    throw NotImplementedError("Handler for code ", m.get_code().value, " not found.");
  }
}

void MessageHandlers::add_handlers() {}

bool MessageHandlers::contains(Code code) const {
  return handlers.count(code) != 0;
}

size_t MessageHandlers::size() const {
  return handlers.size();
}
} // namespace genserver
