#pragma once

#include "message.hpp"
#include "message_handlers.hpp"
#include "typed_gen_server.hpp"

namespace genserver {
// A server taking open structured messages, i.e., a Code plus any arguments.
// Replies are Messages as well. Dispatch with MessageHandlers, e.g.,
//
//   int handle_cast(const Message& m, const int& count) override {
//     int next = count;
//     MessageHandlers{
//       Add - [&](int delta) { next += delta; }
//     }.process(m);
//     return next;
//   }
template<typename StateT, typename ... InitArgT>
using GenServer = TypedGenServer<Message, Message, Message, StateT, InitArgT ...>;
} // namespace genserver
