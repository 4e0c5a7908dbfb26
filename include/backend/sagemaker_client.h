#pragma once

#include <aws/core/client/AWSError.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/sagemaker-runtime/SageMakerRuntimeClient.h>
#include <aws/sagemaker-runtime/SageMakerRuntimeErrors.h>
#include <memory>
#include <string>

#include "backend/backend_client.h"

namespace sagegate {

/// SageMaker runtime through aws-sdk-cpp: InvokeEndpoint and
/// InvokeEndpointWithResponseStream. Credentials come from the SDK's default
/// provider chain (environment, shared profile, SSO, container and instance roles).
class SageMakerClient : public BackendClient {
public:
    SageMakerClient(std::string endpoint_name, const Aws::Client::ClientConfiguration& client_config);

    /// Fails when the endpoint name or the runtime URL override is unusable.
    static Result<std::unique_ptr<BackendClient>> create(const GatewayConfig& config);

    Result<std::string> generate(const BackendPayload& payload) override;
    Result<void> generateStream(const BackendPayload& payload, const StreamEventCallback& on_event) override;
    std::string describe() const override;

private:
    std::string endpoint_name_;
    std::string region_;
    std::string endpoint_override_;
    std::unique_ptr<Aws::SageMakerRuntime::SageMakerRuntimeClient> client_;
};

// Region, timeouts and retries for the runtime client. A non-empty
// backend_url becomes the endpoint override (local emulators, VPC endpoints).
Result<Aws::Client::ClientConfiguration> makeSageMakerClientConfiguration(const GatewayConfig& config);

// 424 or a ModelError* / ModelStreamError exception -> ModelError, anything else -> ServerError.
GatewayError classifySageMakerFailure(int status, const std::string& exception_name);

// Error kind and client-facing message of a failed SDK call or stream event.
Result<void> sageMakerFailure(const Aws::Client::AWSError<Aws::SageMakerRuntime::SageMakerRuntimeErrors>& error);

}  // namespace sagegate
