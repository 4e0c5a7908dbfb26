#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace sagegate {

enum class BackendKind {
    SageMaker,  // SageMaker runtime InvokeEndpoint / InvokeEndpointWithResponseStream
    Http,       // plain text-generation server (/generate, /generate_stream)
};

const char* to_string(BackendKind kind);

struct GatewayConfig {
    std::string endpoint_name;          // backend identifier, also reported as the model id
    std::string region{"eu-north-1"};
    BackendKind backend{BackendKind::SageMaker};
    std::string backend_url;            // empty: https://runtime.sagemaker.<region>.amazonaws.com
    int port{8080};
    std::string bind_address{"0.0.0.0"};
    std::chrono::milliseconds request_timeout{60000};
    std::string cors_allow_origin{"*"};
    std::string cors_allow_methods{"GET, POST, OPTIONS"};
    std::string cors_allow_headers{"Content-Type, Authorization"};
    bool gzip_enabled{true};
};

// Defaults <- JSON file (SAGEGATE_CONFIG or ~/.sagegate/config.json) <- environment.
// The second member describes which sources were applied.
std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog();
GatewayConfig loadGatewayConfig();

}  // namespace sagegate
