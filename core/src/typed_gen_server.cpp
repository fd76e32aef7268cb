#include <atomic>

#include "genserver/typed_gen_server.hpp"

namespace genserver {
namespace impl {
ServerIdType next_server_id() {
  // Server id 0 is never used.
  static std::atomic<ServerIdType> next_id{1};
  return next_id.fetch_add(1, std::memory_order_relaxed);
}
} // namespace impl
} // namespace genserver
