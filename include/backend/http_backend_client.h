#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "backend/backend_client.h"
#include "utils/http_url.h"

namespace sagegate {

/// Text-generation server reachable over plain HTTP(S):
/// POST <base>/generate and POST <base>/generate_stream (server-sent events).
class HttpBackendClient : public BackendClient {
public:
    HttpBackendClient(HttpUrl base_url, std::chrono::milliseconds timeout);

    static Result<std::unique_ptr<BackendClient>> create(const GatewayConfig& config);

    Result<std::string> generate(const BackendPayload& payload) override;
    Result<void> generateStream(const BackendPayload& payload, const StreamEventCallback& on_event) override;
    std::string describe() const override;

private:
    HttpUrl base_url_;
    std::chrono::milliseconds timeout_;
};

}  // namespace sagegate
