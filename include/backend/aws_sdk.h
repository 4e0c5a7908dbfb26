#pragma once

namespace sagegate {

// Runs Aws::InitAPI once per process. Every SDK client is created after it.
void ensureAwsSdkInitialized();

}  // namespace sagegate
