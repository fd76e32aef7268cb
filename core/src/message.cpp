#include "genserver/message.hpp"

namespace genserver {
Message::Message():
  body(std::make_shared<TypedMessageBody<>>()) {
}

Code Message::get_code() const {
  return code;
}

size_t Message::size() const {
  return body->size();
}

std::ostream& operator<<(std::ostream& out, const Message& m) {
  return out << "Message{code: " << m.code.value << ", size: " << m.size() << "}";
}
} // namespace genserver
