#pragma once

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>

#include "genserver/genserver.hpp"

namespace genserver {
namespace test {
struct Increment {};
struct Decrement {};
struct Add { int delta; };
struct GetCount {};
struct IncrementAndGet {};
// keep the worker busy
struct Sleep { std::chrono::milliseconds duration; };
// make the handler throw
struct Fail {};

using CounterCast = std::variant<Increment, Decrement, Add, Sleep, Fail>;
using CounterCall = std::variant<GetCount, IncrementAndGet, Sleep, Fail>;

class CounterServer : public TypedGenServer<CounterCast, CounterCall, int, int> {
public:
  int init() override {
    return 0;
  }

  int handle_cast(const CounterCast& message, const int& count) override {
    return std::visit(overloaded{
      [&](const Increment&) { return count + 1; },
      [&](const Decrement&) { return count - 1; },
      [&](const Add& add) { return count + add.delta; },
      [&](const Sleep& sleep) {
        std::this_thread::sleep_for(sleep.duration);
        return count;
      },
      [&](const Fail&) -> int {
        throw std::runtime_error("Cast handler error");
      }
    }, message);
  }

  std::pair<int, int> handle_call(const CounterCall& message, const int& count) override {
    return std::visit(overloaded{
      [&](const GetCount&) { return std::make_pair(count, count); },
      [&](const IncrementAndGet&) { return std::make_pair(count + 1, count + 1); },
      [&](const Sleep& sleep) {
        std::this_thread::sleep_for(sleep.duration);
        return std::make_pair(count, count);
      },
      [&](const Fail&) -> std::pair<int, int> {
        throw std::invalid_argument("Call handler error");
      }
    }, message);
  }

  void terminate(const int& count) override {
    final_count.store(count);
    num_terminations.fetch_add(1);
  }

  std::atomic<int> final_count{-1};
  std::atomic<int> num_terminations{0};
};
} // namespace test
} // namespace genserver
