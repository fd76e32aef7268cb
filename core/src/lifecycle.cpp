#include "genserver/lifecycle.hpp"

namespace genserver {
const char* to_cstring(LifecycleState s) {
  switch (s) {
    case LifecycleState::Created: return "Created";
    case LifecycleState::Running: return "Running";
    case LifecycleState::Stopping: return "Stopping";
    case LifecycleState::Stopped: return "Stopped";
    case LifecycleState::Failed: return "Failed";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& out, LifecycleState s) {
  return out << to_cstring(s);
}
} // namespace genserver
