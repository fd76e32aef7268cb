#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include "genserver_exception.hpp"

#include "glog/logging.h"

namespace genserver {
// Own a server and stop it before it is destroyed,
// such that no callback runs on a partially destroyed server.
template<typename ServerType>
class ScopedGenServer {
public:
  ScopedGenServer() = default;

  explicit ScopedGenServer(ServerType* server):
    server(server) {
  }

  explicit ScopedGenServer(std::unique_ptr<ServerType>&& server):
    server(std::move(server)) {
  }

  ScopedGenServer(const ScopedGenServer<ServerType>&) = delete;
  ScopedGenServer(ScopedGenServer<ServerType>&&) = default;

  ScopedGenServer<ServerType>& operator=(std::nullptr_t) {
    reset();
    return *this;
  }

  ScopedGenServer<ServerType>& operator=(ScopedGenServer<ServerType>&& other) {
    if (this != &other) {
      reset();
      server = std::move(other.server);
    }
    return *this;
  }

  ~ScopedGenServer() {
    reset();
  }

  // stop (waiting without bound) and destroy the owned server
  void reset() {
    if (!server) {
      return;
    }
    try {
      server->stop();
    } catch (...) {
      LOG(ERROR) << "Failed to stop " << server->get_name() << " before destruction.\n"
        << describe_exception(std::current_exception());
    }
    server = nullptr;
  }

  ServerType* get() const {
    return server.get();
  }

  ServerType* operator->() const {
    return server.get();
  }

  ServerType& operator*() const {
    return *server;
  }

  explicit operator bool() const {
    return bool(server);
  }

private:
  std::unique_ptr<ServerType> server = nullptr;
};

template<typename ServerType, typename ... ArgT>
ScopedGenServer<ServerType> make_scoped(ArgT&& ... args) {
  return ScopedGenServer<ServerType>(new ServerType(std::forward<ArgT>(args) ...));
}
} // namespace genserver
