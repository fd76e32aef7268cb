#pragma once

#include <ostream>

namespace genserver {
//  Created --start--> Running --stop--> Stopping --worker exits--> Stopped
//     |                  |
//     +--init throws-----+--worker loop faults--> Failed
enum class LifecycleState {
  Created,
  Running,
  Stopping,
  Stopped,
  Failed,
};

const char* to_cstring(LifecycleState s);

std::ostream& operator<<(std::ostream& out, LifecycleState s);
} // namespace genserver
