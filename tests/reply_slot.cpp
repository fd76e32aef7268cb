#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "genserver/reply_slot.hpp"

#include "gtest/gtest.h"

namespace genserver {
GTEST_TEST(ReplySlot, SetValueOnce) {
  ReplySlot<std::string> slot;
  EXPECT_FALSE(slot.is_ready());
  EXPECT_TRUE(slot.set_value("first"));
  EXPECT_FALSE(slot.set_value("second"));
  EXPECT_FALSE(slot.set_exception(std::make_exception_ptr(std::runtime_error("third"))));
  EXPECT_TRUE(slot.is_ready());
  slot.wait();
  EXPECT_EQ(slot.take(), "first");
  EXPECT_THROW(slot.take(), GenServerError);
}

GTEST_TEST(ReplySlot, SetException) {
  ReplySlot<int> slot;
  EXPECT_TRUE(slot.set_exception(std::make_exception_ptr(std::out_of_range("bad"))));
  EXPECT_FALSE(slot.set_value(1));
  EXPECT_TRUE(slot.wait_for(std::chrono::milliseconds(0)));
  EXPECT_THROW(slot.take(), std::out_of_range);
}

GTEST_TEST(ReplySlot, TakeBeforeReady) {
  ReplySlot<int> slot;
  EXPECT_THROW(slot.take(), GenServerError);
}

GTEST_TEST(ReplySlot, WaitForTimeout) {
  ReplySlot<int> slot;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(slot.wait_for(std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

GTEST_TEST(ReplySlot, WakeUpWaiter) {
  auto slot = std::make_shared<ReplySlot<int>>();
  std::thread writer([slot]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    slot->set_value(42);
  });
  EXPECT_TRUE(slot->wait_for(std::chrono::seconds(10)));
  EXPECT_EQ(slot->take(), 42);
  writer.join();
}

GTEST_TEST(ReplySlot, WriteAfterAbandon) {
  ReplySlot<int> slot;
  EXPECT_TRUE(slot.abandon());
  EXPECT_TRUE(slot.is_abandoned());
  EXPECT_FALSE(slot.set_value(1));
  EXPECT_FALSE(slot.set_exception(std::make_exception_ptr(std::runtime_error("late"))));
  EXPECT_FALSE(slot.is_ready());
}

GTEST_TEST(ReplySlot, AbandonAfterWrite) {
  ReplySlot<int> slot;
  EXPECT_TRUE(slot.set_value(1));
  EXPECT_FALSE(slot.abandon());
  EXPECT_FALSE(slot.is_abandoned());
  EXPECT_EQ(slot.take(), 1);
}

// Either the reader gives up or the writer delivers, never both
GTEST_TEST(ReplySlot, AbandonRacesWithWrite) {
  for (int i = 0; i < 1000; i++) {
    auto slot = std::make_shared<ReplySlot<int>>();
    bool delivered = false;
    std::thread writer([slot, &delivered]() {
      delivered = slot->set_value(1);
    });
    bool abandoned = !slot->wait_for(std::chrono::microseconds(i % 50)) && slot->abandon();
    writer.join();
    ASSERT_NE(delivered, abandoned);
    if (delivered) {
      EXPECT_EQ(slot->take(), 1);
    }
  }
}

GTEST_TEST(ReplySlot, MoveOnlyValue) {
  ReplySlot<std::unique_ptr<int>> slot;
  EXPECT_TRUE(slot.set_value(std::make_unique<int>(7)));
  auto v = slot.take();
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(*v, 7);
}
} // namespace genserver
