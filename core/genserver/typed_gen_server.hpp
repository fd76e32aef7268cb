#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "genserver_exception.hpp"
#include "lifecycle.hpp"
#include "macros.hpp"
#include "mailbox.hpp"
#include "reply_slot.hpp"
#include "thread_utils.hpp"
#include "traits.hpp"

#include "glog/logging.h"

namespace genserver {
namespace impl {
// process-unique id used in default server names
ServerIdType next_server_id();
} // namespace impl

/**
 * A server owning a private state of type `StateT`, mutated only by one dedicated
 * worker thread that drains a FIFO mailbox.
 *
 * - cast(m): enqueue m and return; the worker applies handle_cast(m, state)
 * - call(m): enqueue m and block until the worker replies with handle_call(m, state)
 * - start(args ...): spawn the worker, which runs init(args ...) before anything else
 * - stop(): enqueue a stop signal behind all pending messages and wait for the worker
 *
 * `CastT` and `CallT` can be any movable type. Use a std::variant to accept a
 * closed set of message shapes, or genserver::Message (see GenServer) for an
 * open structured payload.
 **/
template<typename CastT, typename CallT, typename ReplyT, typename StateT, typename ... InitArgT>
class TypedGenServer {
  static_assert(!std::is_void_v<ReplyT>, "ReplyT must not be void.");
  static_assert(std::is_move_assignable_v<StateT>, "StateT must be move-assignable.");

public:
  using CastMessage = CastT;
  using CallMessage = CallT;
  using Reply = ReplyT;
  using State = StateT;
  using Clock = std::chrono::steady_clock;

  TypedGenServer();
  TypedGenServer(const TypedGenServer&) = delete;
  TypedGenServer& operator=(const TypedGenServer&) = delete;

  /**
   * To be overrided by subclass. All of them run on the worker thread only.
   **/
  virtual StateT init(InitArgT ... args) = 0;
  // default: keep the state and log a warning
  virtual StateT handle_cast(const CastT& message, const StateT& state);
  // default: fail the call with NotImplementedError
  virtual std::pair<ReplyT, StateT> handle_call(const CallT& message, const StateT& state);
  // best effort cleanup; exceptions are logged, not propagated
  virtual void terminate(const StateT& state);

  virtual std::string get_name() const;

  /**
   * To be used by clients
   **/
  // Spawn the worker and wait for init() to finish on it.
  // Throw AlreadyStartedError if the server is not newly created,
  // or InitFailedError (with the exception of init() nested) if init() throws.
  void start(InitArgT ... args);

  // Enqueue the stop signal and wait for the worker to exit.
  // No-op if the server is not running, e.g., stopped already.
  void stop();

  // Throw GenServerTimeoutError if the worker does not exit within `timeout`;
  // the worker is left running and a later stop() waits for it again.
  template<typename Rep, typename Period>
  void stop(const std::chrono::duration<Rep, Period>& timeout) {
    stop_until(Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
  }

  // Throw NotRunningError (NotStartedError, StoppedError) if the server is not running
  void cast(CastT message);

  // Throw NotRunningError (NotStartedError, StoppedError) if the server is not running,
  // or CallbackError (with the exception of handle_call() nested) if handle_call() throws
  ReplyT call(CallT message);

  // Throw GenServerTimeoutError if no reply arrives within `timeout`.
  // The request is not cancelled: the worker still handles it and its reply is dropped.
  template<typename Rep, typename Period>
  ReplyT call(CallT message, const std::chrono::duration<Rep, Period>& timeout) {
    return call_until(std::move(message),
      Clock::now() + std::chrono::duration_cast<Clock::duration>(timeout));
  }

  LifecycleState get_lifecycle_state() const;
  bool is_running() const;
  ServerIdType get_server_id() const;

  virtual ~TypedGenServer();

protected:
  // whether the current thread is the worker of this server
  bool is_worker_thread() const;

private:
  struct CastEntry {
    CastT message;
  };

  struct CallEntry {
    CallT message;
    RequestIdType request_id;
    std::shared_ptr<ReplySlot<ReplyT>> reply_slot;
  };

  struct StopEntry {};

  using Entry = std::variant<CastEntry, CallEntry, StopEntry>;
  using InitArgs = std::tuple<std::decay_t<InitArgT> ...>;

  void run(InitArgs args, std::shared_ptr<ReplySlot<LifecycleState>> started);
  void process(CastEntry& entry, StateT& state);
  void process(CallEntry& entry, StateT& state);
  void fail_pending_calls();

  void check_running() const;
  ReplyT call_until(CallT message, std::optional<Clock::time_point> deadline);
  void stop_until(std::optional<Clock::time_point> deadline);

  const ServerIdType server_id;
  std::atomic<LifecycleState> lifecycle{LifecycleState::Created};
  // serialize start / stop and guard `worker`
  std::mutex lifecycle_mtx;
  std::thread worker;
  std::atomic<std::thread::id> worker_id{};
  Mailbox<Entry> mailbox;
  // written by the worker right before it exits, with the final lifecycle state
  const std::shared_ptr<ReplySlot<LifecycleState>> exited;
  std::atomic<RequestIdType> next_request_id{0};
};
} // namespace genserver

#include "typed_gen_server.tpp"
