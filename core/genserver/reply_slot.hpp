#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

#include "genserver_exception.hpp"

namespace genserver {
/**
 * Single-use rendezvous between the worker (writer) and one waiting caller (reader).
 * 1. at most one write (value or exception) is accepted; later writes return false
 * 2. the reader may abandon the slot, e.g., on timeout;
 *    writes to an abandoned slot are dropped and return false without blocking
 * 3. `answered` is set once the slot is written or abandoned, so late writers
 *    return without taking the lock
 * 4. the slot is shared by std::shared_ptr so that whichever side finishes last frees it
 */
template<typename T>
class ReplySlot {
public:
  using Clock = std::chrono::steady_clock;

  ReplySlot() = default;
  ReplySlot(const ReplySlot&) = delete;
  ReplySlot& operator=(const ReplySlot&) = delete;

  template<typename U>
  bool set_value(U&& v) {
    if (answered.load(std::memory_order_acquire)) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (ready || abandoned) {
        return false;
      }
      // may throw, leaving the slot unwritten
      value.emplace(std::forward<U>(v));
      ready = true;
      answered.store(true, std::memory_order_release);
    }
    cv.notify_all();
    return true;
  }

  bool set_exception(std::exception_ptr e) {
    if (answered.load(std::memory_order_acquire)) {
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mtx);
      if (ready || abandoned) {
        return false;
      }
      error = std::move(e);
      ready = true;
      answered.store(true, std::memory_order_release);
    }
    cv.notify_all();
    return true;
  }

  void wait() {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [&]() { return ready; });
  }

  // Return false if nothing is written before `deadline`
  bool wait_until(const Clock::time_point& deadline) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_until(lock, deadline, [&]() { return ready; });
  }

  template<typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
    return wait_until(Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
  }

  // Give up reading. Return false if the slot has been written already,
  // in which case the result is still available.
  bool abandon() {
    std::lock_guard<std::mutex> lock(mtx);
    if (ready) {
      return false;
    }
    abandoned = true;
    answered.store(true, std::memory_order_release);
    return true;
  }

  bool is_ready() const {
    std::lock_guard<std::mutex> lock(mtx);
    return ready;
  }

  bool is_abandoned() const {
    std::lock_guard<std::mutex> lock(mtx);
    return abandoned;
  }

  // Take the written value, or rethrow the written exception.
  // Note: ensure the slot is ready, i.e., wait() or wait_until() returned true
  T take() {
    std::lock_guard<std::mutex> lock(mtx);
    if (!ready) {
      throw GenServerError("Attempt to take from a reply slot that has not been written.");
    }
    if (error) {
      std::rethrow_exception(error);
    }
    if (!value) {
      throw GenServerError("Attempt to take from a reply slot twice.");
    }
    T v = std::move(*value);
    value.reset();
    return v;
  }

private:
  std::atomic<bool> answered{false};
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool ready = false;
  bool abandoned = false;
  std::optional<T> value;
  std::exception_ptr error;
};
} // namespace genserver
