#include "runtime/state.h"

namespace sagegate {

std::atomic<bool> g_running_flag{true};

}  // namespace sagegate
