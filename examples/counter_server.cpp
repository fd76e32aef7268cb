#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "genserver/genserver.hpp"

constexpr genserver::Code Increment{0};
constexpr genserver::Code Add{1};
constexpr genserver::Code GetCount{2};
constexpr genserver::Code Count{3};

// a counter taking open structured messages
class Counter : public genserver::GenServer<int, int> {
public:
  int init(int initial) override {
    LOG(INFO) << get_name() << " starts counting from " << initial;
    return initial;
  }

  int handle_cast(const genserver::Message& m, const int& count) override {
    int next = count;
    genserver::MessageHandlers{
      Increment - [&]() { next++; },
      Add - [&](int delta) { next += delta; }
    }.process(m);
    return next;
  }

  std::pair<genserver::Message, int> handle_call(const genserver::Message& m,
      const int& count) override {
    genserver::Message reply;
    genserver::MessageHandlers{
      GetCount - [&]() { reply = genserver::Message(Count, count); }
    }.process(m);
    return {reply, count};
  }

  void terminate(const int& count) override {
    LOG(INFO) << get_name() << " terminates with count " << count;
  }
};

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  auto counter = genserver::make_scoped<Counter>();
  counter->start(100);

  std::vector<std::thread> clients;
  for (int i = 0; i < 4; i++) {
    clients.emplace_back([&counter, i]() {
      counter->cast(genserver::Message(Increment));
      counter->cast(genserver::Message(Add, i));
    });
  }
  for (auto& c : clients) {
    c.join();
  }
  // 100 + 4 + (0 + 1 + 2 + 3)
  auto reply = counter->call(genserver::Message(GetCount));
  LOG(INFO) << "Expected 110, received " << reply.get<int>();
}
