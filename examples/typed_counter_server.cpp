#include <chrono>
#include <string>
#include <utility>
#include <variant>

#include "genserver/genserver.hpp"

struct Increment {};
struct Decrement {};
struct GetCount {};
struct IncrementAndGet {};

using CounterCast = std::variant<Increment, Decrement>;
using CounterCall = std::variant<GetCount, IncrementAndGet>;

// a counter taking a closed set of messages, checked at compile time
class Counter : public genserver::TypedGenServer<CounterCast, CounterCall, int, int> {
public:
  int init() override {
    return 0;
  }

  int handle_cast(const CounterCast& m, const int& count) override {
    return std::visit(genserver::overloaded{
      [&](const Increment&) { return count + 1; },
      [&](const Decrement&) { return count - 1; }
    }, m);
  }

  std::pair<int, int> handle_call(const CounterCall& m, const int& count) override {
    return std::visit(genserver::overloaded{
      [&](const GetCount&) { return std::make_pair(count, count); },
      [&](const IncrementAndGet&) { return std::make_pair(count + 1, count + 1); }
    }, m);
  }
};

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  Counter counter;
  counter.start();
  counter.cast(Increment{});
  counter.cast(Increment{});
  LOG(INFO) << "Expected 2, received " << counter.call(GetCount{});
  LOG(INFO) << "Expected 3, received " << counter.call(IncrementAndGet{}, std::chrono::seconds(1));
  counter.stop();
  try {
    counter.cast(Decrement{});
  } catch (const genserver::StoppedError& e) {
    LOG(INFO) << "Expected StoppedError, received " << e.what();
  }
}
