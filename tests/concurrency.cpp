#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "genserver/typed_gen_server.hpp"
#include "test_servers.hpp"

#include "gtest/gtest.h"

namespace genserver {
using namespace test;

GTEST_TEST(Concurrency, HundredCallers) {
  constexpr int NumCallers = 100;
  CounterServer server;
  server.start();
  std::vector<int> replies(NumCallers, 0);
  std::vector<std::thread> callers;
  for (int i = 0; i < NumCallers; i++) {
    callers.emplace_back([i, &server, &replies]() {
      replies[i] = server.call(IncrementAndGet{});
    });
  }
  for (auto& c : callers) {
    c.join();
  }
  EXPECT_EQ(server.call(GetCount{}), NumCallers);
  // each caller gets its own reply, i.e., the replies are 1 .. 100
  std::sort(replies.begin(), replies.end());
  for (int i = 0; i < NumCallers; i++) {
    EXPECT_EQ(replies[i], i + 1);
  }
  server.stop();
}

GTEST_TEST(Concurrency, ManyCasters) {
  constexpr int NumCasters = 8;
  constexpr int NumCasts = 1000;
  CounterServer server;
  server.start();
  std::vector<std::thread> casters;
  for (int i = 0; i < NumCasters; i++) {
    casters.emplace_back([&server]() {
      for (int j = 0; j < NumCasts; j++) {
        server.cast(Increment{});
      }
    });
  }
  for (auto& c : casters) {
    c.join();
  }
  EXPECT_EQ(server.call(GetCount{}), NumCasters * NumCasts);
  server.stop();
}

// A caller sees its own casts before its own calls
GTEST_TEST(Concurrency, PerCallerOrder) {
  constexpr int NumCallers = 8;
  constexpr int NumRounds = 200;
  CounterServer server;
  server.start();
  std::atomic<int> violations{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < NumCallers; i++) {
    callers.emplace_back([&server, &violations]() {
      for (int j = 1; j <= NumRounds; j++) {
        server.cast(Increment{});
        // at least j increments (our own) have been applied
        if (server.call(GetCount{}) < j) {
          violations++;
        }
      }
    });
  }
  for (auto& c : callers) {
    c.join();
  }
  EXPECT_EQ(violations.load(), 0);
  EXPECT_EQ(server.call(GetCount{}), NumCallers * NumRounds);
  server.stop();
}

GTEST_TEST(Concurrency, CallTimeout) {
  using namespace std::chrono;
  CounterServer server;
  server.start();
  auto start = steady_clock::now();
  EXPECT_THROW(server.call(Sleep{milliseconds(500)}, milliseconds(100)), GenServerTimeoutError);
  auto elapsed = steady_clock::now() - start;
  EXPECT_GE(elapsed, milliseconds(100));
  EXPECT_LT(elapsed, milliseconds(400));
  // the worker survives and serves the next call once the slow one is done
  EXPECT_TRUE(server.is_running());
  EXPECT_EQ(server.call(IncrementAndGet{}), 1);
  server.stop();
}

GTEST_TEST(Concurrency, TimeoutsAndRepliesMixed) {
  using namespace std::chrono;
  CounterServer server;
  server.start();
  std::atomic<int> timeouts{0};
  std::atomic<int> replies{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < 20; i++) {
    callers.emplace_back([&]() {
      try {
        server.call(IncrementAndGet{}, milliseconds(1));
        replies++;
      } catch (const GenServerTimeoutError&) {
        timeouts++;
      }
    });
  }
  for (auto& c : callers) {
    c.join();
  }
  EXPECT_EQ(timeouts + replies, 20);
  // requests are handled whether or not their callers are still waiting
  EXPECT_EQ(server.call(GetCount{}), 20);
  server.stop();
}

GTEST_TEST(Concurrency, CallsRacingWithStop) {
  CounterServer server;
  server.start();
  std::atomic<int> handled{0};
  std::atomic<int> refused{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < 8; i++) {
    callers.emplace_back([&]() {
      for (int j = 0; j < 100; j++) {
        try {
          server.call(IncrementAndGet{});
          handled++;
        } catch (const NotRunningError&) {
          refused++;
        }
      }
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  server.stop();
  for (auto& c : callers) {
    c.join();
  }
  // every call is either answered or refused, none is lost
  EXPECT_EQ(handled + refused, 800);
  EXPECT_EQ(server.final_count.load(), handled.load());
}

GTEST_TEST(Concurrency, ConcurrentStops) {
  CounterServer server;
  server.start();
  server.cast(Sleep{std::chrono::milliseconds(50)});
  std::vector<std::thread> stoppers;
  for (int i = 0; i < 4; i++) {
    stoppers.emplace_back([&server]() { server.stop(); });
  }
  for (auto& s : stoppers) {
    s.join();
  }
  EXPECT_EQ(server.get_lifecycle_state(), LifecycleState::Stopped);
  EXPECT_EQ(server.num_terminations.load(), 1);
}
} // namespace genserver
