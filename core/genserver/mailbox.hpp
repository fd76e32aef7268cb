#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <ostream>
#include <utility>

#include "genserver_exception.hpp"

namespace genserver {
/**
 * Unbounded multi-writer single-reader queue of mailbox entries.
 * 1. any number of threads may push concurrently; only the owning worker pops
 * 2. entries are popped strictly in the order the pushes acquired the lock (FIFO)
 * 3. push never blocks beyond the lock, i.e., there is no capacity
 * 4. the mailbox accepts entries only between open() and close();
 *    push_and_close() appends the last entry and closes in one step so that
 *    nothing can be queued behind it
 */
template<typename Entry>
class Mailbox {
public:
  enum class Status {
    Unopened,
    Open,
    Closed,
  };

  Mailbox() = default;
  Mailbox(const Mailbox&) = delete;
  Mailbox& operator=(const Mailbox&) = delete;

  void open() {
    std::lock_guard<std::mutex> lock(mtx);
    if (status != Status::Unopened) {
      throw GenServerError("Attempt to open a mailbox twice.");
    }
    status = Status::Open;
  }

  template<typename U>
  void push(U&& entry) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      check_open();
      entries.emplace_back(std::forward<U>(entry));
    }
    not_empty.notify_one();
  }

  template<typename U>
  void push_and_close(U&& entry) {
    {
      std::lock_guard<std::mutex> lock(mtx);
      check_open();
      entries.emplace_back(std::forward<U>(entry));
      status = Status::Closed;
    }
    not_empty.notify_one();
  }

  // Block until an entry is available.
  // A closed mailbox is still drained; popping a closed and empty mailbox throws.
  Entry pop() {
    std::unique_lock<std::mutex> lock(mtx);
    not_empty.wait(lock, [&]() {
      return !entries.empty() || status == Status::Closed;
    });
    return take_front();
  }

  // Refuse further pushes and hand back whatever is still queued
  std::deque<Entry> close() {
    std::deque<Entry> remaining;
    {
      std::lock_guard<std::mutex> lock(mtx);
      status = Status::Closed;
      remaining.swap(entries);
    }
    not_empty.notify_all();
    return remaining;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
  }

  friend std::ostream& operator<<(std::ostream& out, const Mailbox<Entry>& mailbox) {
    std::lock_guard<std::mutex> lock(mailbox.mtx);
    out << "Mailbox{"
        << &mailbox
        << ", size: " << mailbox.entries.size()
        << ", status: " << static_cast<int>(mailbox.status)
        << "}";
    return out;
  }

private:
  // with `mtx` held
  inline void check_open() const {
    switch (status) {
      case Status::Unopened:
        throw NotStartedError("Attempt to enqueue into a mailbox that is not opened yet.");
      case Status::Closed:
        throw StoppedError("Attempt to enqueue into a closed mailbox.");
      case Status::Open:
        break;
    }
  }

  // with `mtx` held and `entries` not empty or the mailbox closed
  inline Entry take_front() {
    if (entries.empty()) {
      throw StoppedError("Attempt to pop from a closed and drained mailbox.");
    }
    Entry entry = std::move(entries.front());
    entries.pop_front();
    return entry;
  }

  mutable std::mutex mtx;
  std::condition_variable not_empty;
  std::deque<Entry> entries;
  Status status = Status::Unopened;
};
} // namespace genserver
