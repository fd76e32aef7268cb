// To be included at the end of typed_gen_server.hpp

namespace genserver {
#define GENSERVER_TEMPLATE \
  template<typename CastT, typename CallT, typename ReplyT, typename StateT, typename ... InitArgT>
#define GENSERVER_CLASS TypedGenServer<CastT, CallT, ReplyT, StateT, InitArgT ...>

GENSERVER_TEMPLATE
GENSERVER_CLASS::TypedGenServer():
  server_id(impl::next_server_id()),
  exited(std::make_shared<ReplySlot<LifecycleState>>()) {
}

GENSERVER_TEMPLATE
StateT GENSERVER_CLASS::handle_cast(const CastT&, const StateT& state) {
  LOG(WARNING) << this->get_name() << " received an unhandled cast message. "
    "Override handle_cast to handle it.";
  return state;
}

GENSERVER_TEMPLATE
std::pair<ReplyT, StateT> GENSERVER_CLASS::handle_call(const CallT&, const StateT&) {
  throw NotImplementedError(this->get_name(), " does not implement handle_call.");
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::terminate(const StateT&) {
  LOG(INFO) << this->get_name() << " is terminating.";
}

GENSERVER_TEMPLATE
std::string GENSERVER_CLASS::get_name() const {
  return to_string(GENSERVER_THREAD_NAME_PREFIX, server_id);
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::start(InitArgT ... args) {
  std::lock_guard<std::mutex> lock(lifecycle_mtx);
  auto current = lifecycle.load();
  if (current != LifecycleState::Created) {
    throw AlreadyStartedError(this->get_name(), " has been started already. "
      "Current state: ", current);
  }
  mailbox.open();
  auto started = std::make_shared<ReplySlot<LifecycleState>>();
  try {
    worker = std::thread([this, started, init_args = InitArgs(args ...)]() mutable {
      this->run(std::move(init_args), std::move(started));
    });
  } catch (...) {
    mailbox.close();
    lifecycle.store(LifecycleState::Failed);
    std::throw_with_nested(GenServerError("Failed to spawn the worker of ", this->get_name()));
  }
  started->wait();
  try {
    started->take();
  } catch (const InitFailedError&) {
    worker.join();
    mailbox.close();
    lifecycle.store(LifecycleState::Failed);
    VLOG(1) << this->get_name() << " failed to start.";
    throw;
  }
  lifecycle.store(LifecycleState::Running);
  VLOG(1) << this->get_name() << " started.";
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::stop() {
  stop_until(std::nullopt);
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::stop_until(std::optional<Clock::time_point> deadline) {
  // init() is running and start() holds `lifecycle_mtx`; there is nothing to stop yet
  if (this->is_worker_thread() && lifecycle.load() == LifecycleState::Created) {
    VLOG(1) << this->get_name() << " ignores stop() called from init().";
    return;
  }
  {
    std::lock_guard<std::mutex> lock(lifecycle_mtx);
    auto expected = LifecycleState::Running;
    if (lifecycle.compare_exchange_strong(expected, LifecycleState::Stopping)) {
      VLOG(1) << this->get_name() << " is stopping.";
      try {
        mailbox.push_and_close(StopEntry{});
      } catch (const StoppedError&) {
        // the worker loop has faulted and closed the mailbox; it is exiting anyway
        VLOG(1) << this->get_name() << " is exiting without the stop signal.";
      }
    }
    // never started, failed to start, or joined by a previous stop
    if (!worker.joinable()) {
      return;
    }
    // the worker exits after the current callback returns
    if (this->is_worker_thread()) {
      return;
    }
  }
  if (deadline) {
    if (!exited->wait_until(*deadline)) {
      throw GenServerTimeoutError(this->get_name(), " did not stop within the timeout. "
        "Its worker is left running.");
    }
  } else {
    exited->wait();
  }
  std::lock_guard<std::mutex> lock(lifecycle_mtx);
  if (worker.joinable()) {
    worker.join();
  }
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::cast(CastT message) {
  check_running();
  mailbox.push(CastEntry{std::move(message)});
}

GENSERVER_TEMPLATE
ReplyT GENSERVER_CLASS::call(CallT message) {
  return call_until(std::move(message), std::nullopt);
}

GENSERVER_TEMPLATE
ReplyT GENSERVER_CLASS::call_until(CallT message, std::optional<Clock::time_point> deadline) {
  if (this->is_worker_thread()) {
    throw GenServerError(this->get_name(), " cannot call itself from its own worker. "
      "The call would never be answered.");
  }
  check_running();
  auto reply_slot = std::make_shared<ReplySlot<ReplyT>>();
  auto request_id = next_request_id.fetch_add(1, std::memory_order_relaxed);
  mailbox.push(CallEntry{std::move(message), request_id, reply_slot});
  if (deadline) {
    // abandon() fails if the reply is written right after the timeout; take it then
    if (!reply_slot->wait_until(*deadline) && reply_slot->abandon()) {
      throw GenServerTimeoutError(this->get_name(), " did not reply to request ",
        request_id, " within the timeout.");
    }
  } else {
    reply_slot->wait();
  }
  return reply_slot->take();
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::check_running() const {
  auto current = lifecycle.load();
  switch (current) {
    case LifecycleState::Running:
      return;
    case LifecycleState::Created:
      throw NotStartedError(this->get_name(), " is not started yet.");
    case LifecycleState::Stopping:
    case LifecycleState::Stopped:
      throw StoppedError(this->get_name(), " is ", current, ".");
    case LifecycleState::Failed:
      throw NotRunningError(this->get_name(), " has failed.");
  }
  throw NotRunningError(this->get_name(), " is in an unknown state.");
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::run(InitArgs args, std::shared_ptr<ReplySlot<LifecycleState>> started) {
  worker_id.store(std::this_thread::get_id());
#if GENSERVER_ENABLE_THREAD_NAME
  try {
    thread::set_name(this->get_name());
  } catch (const GenServerError& e) {
    LOG(WARNING) << "Worker thread keeps its default name. " << e.what();
  }
#endif

  std::optional<StateT> state;
  try {
    state.emplace(std::apply([this](auto& ... a) {
      return this->init(std::move(a) ...);
    }, args));
  } catch (...) {
    auto error = make_nested_exception_ptr<InitFailedError>(
      this->get_name(), " failed to initialize.");
    LOG(ERROR) << describe_exception(error);
    worker_id.store(std::thread::id{});
    started->set_exception(error);
    return;
  }
  started->set_value(LifecycleState::Running);

  auto final_state = LifecycleState::Stopped;
  try {
    for (bool stopping = false; !stopping;) {
      auto entry = mailbox.pop();
      std::visit(overloaded{
        [&](CastEntry& e) { this->process(e, *state); },
        [&](CallEntry& e) { this->process(e, *state); },
        [&](StopEntry&) { stopping = true; }
      }, entry);
    }
  } catch (...) {
    // callbacks never throw out of process(), so only the loop itself can get here
    LOG(ERROR) << this->get_name() << " worker loop faulted on " << mailbox
      << ". Pending calls are failed.\n"
      << describe_exception(std::current_exception());
    final_state = LifecycleState::Failed;
    lifecycle.store(LifecycleState::Failed);
    fail_pending_calls();
  }

  try {
    this->terminate(*state);
  } catch (...) {
    LOG(ERROR) << this->get_name() << " terminate failed.\n"
      << describe_exception(std::current_exception());
  }

  if (final_state == LifecycleState::Stopped) {
    lifecycle.store(LifecycleState::Stopped);
  }
  VLOG(1) << this->get_name() << " exits with state " << final_state << ".";
  worker_id.store(std::thread::id{});
  exited->set_value(final_state);
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::process(CastEntry& entry, StateT& state) {
  try {
    state = this->handle_cast(entry.message, state);
  } catch (...) {
    auto error = make_nested_exception_ptr<CallbackError>(this->get_name(),
      " failed to handle a cast message. The message is dropped and the state is kept.");
    LOG(ERROR) << describe_exception(error);
  }
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::process(CallEntry& entry, StateT& state) {
  bool delivered = false;
  try {
    auto result = this->handle_call(entry.message, state);
    state = std::move(result.second);
    delivered = entry.reply_slot->set_value(std::move(result.first));
  } catch (...) {
    auto error = make_nested_exception_ptr<CallbackError>(this->get_name(),
      " failed to handle call request ", entry.request_id, ".");
    LOG(ERROR) << describe_exception(error);
    delivered = entry.reply_slot->set_exception(error);
  }
  if (!delivered) {
    LOG(WARNING) << this->get_name() << " dropped the reply to request " << entry.request_id
      << " because its caller stopped waiting.";
  }
}

GENSERVER_TEMPLATE
void GENSERVER_CLASS::fail_pending_calls() {
  for (auto& entry : mailbox.close()) {
    if (auto call_entry = std::get_if<CallEntry>(&entry)) {
      call_entry->reply_slot->set_exception(std::make_exception_ptr(
        StoppedError(this->get_name(), " exited before handling request ",
          call_entry->request_id, ".")));
    }
  }
}

GENSERVER_TEMPLATE
LifecycleState GENSERVER_CLASS::get_lifecycle_state() const {
  return lifecycle.load();
}

GENSERVER_TEMPLATE
bool GENSERVER_CLASS::is_running() const {
  return lifecycle.load() == LifecycleState::Running;
}

GENSERVER_TEMPLATE
ServerIdType GENSERVER_CLASS::get_server_id() const {
  return server_id;
}

GENSERVER_TEMPLATE
bool GENSERVER_CLASS::is_worker_thread() const {
  return worker_id.load() == std::this_thread::get_id();
}

GENSERVER_TEMPLATE
GENSERVER_CLASS::~TypedGenServer() {
  if (!worker.joinable()) {
    return;
  }
  if (this->is_worker_thread()) {
    LOG(ERROR) << "Server " << server_id << " is destroyed by its own worker. "
      "The worker is detached.";
    worker.detach();
    return;
  }
  if (lifecycle.load() == LifecycleState::Running) {
    LOG(ERROR) << "Server " << server_id << " is destroyed while running. Its "
      << mailbox.size() << " queued messages and terminate() go to the default callbacks "
      "of TypedGenServer, not to the subclass. "
      "Stop it, or own it by ScopedGenServer, before destruction.";
  }
  try {
    stop_until(std::nullopt);
  } catch (...) {
    LOG(ERROR) << "Failed to stop server " << server_id << " on destruction.\n"
      << describe_exception(std::current_exception());
  }
  if (worker.joinable()) {
    worker.join();
  }
}

#undef GENSERVER_CLASS
#undef GENSERVER_TEMPLATE
} // namespace genserver
