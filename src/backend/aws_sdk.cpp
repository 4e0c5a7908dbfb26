#include "backend/aws_sdk.h"

#include <aws/core/Aws.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace sagegate {

void ensureAwsSdkInitialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        // Lives for the whole process; the SDK is never shut down.
        static Aws::SDKOptions options;
        Aws::InitAPI(options);
        spdlog::debug("AWS SDK initialized");
    });
}

}  // namespace sagegate
