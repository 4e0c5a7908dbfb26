#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "backend/backend_client.h"
#include "gateway/error_mapper.h"
#include "gateway/format_translator.h"
#include "gateway/types.h"
#include "utils/config.h"

namespace sagegate {

/// Router + handlers. Stateless per request; the only shared state is the
/// lazily created backend client.
class Gateway {
public:
    static constexpr int64_t kModelCreated = 1677610602;
    static constexpr const char* kModelOwner = "sagemaker";

    // Backend built from the configuration on first use.
    explicit Gateway(GatewayConfig config);
    Gateway(GatewayConfig config, BackendFactory factory);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// Never throws; every outcome is a response with CORS headers.
    GatewayResponse handle(const InboundRequest& request, const InvocationContext& context);

    const GatewayConfig& config() const { return config_; }
    const CorsPolicy& cors() const { return cors_; }
    bool backendInitialized() const { return backend_.initialized(); }

private:
    GatewayResponse dispatch(const InboundRequest& request, const std::string& request_id);
    GatewayResponse handleModels() const;
    GatewayResponse handlePreflight() const;
    GatewayResponse handleCompletion(const InboundRequest& request, const std::string& request_id);
    GatewayResponse completeSync(const TranslatedRequest& request, BackendClient& client,
                                 const ResponseMeta& meta, const std::string& request_id);
    GatewayResponse completeStream(TranslatedRequest request, BackendClient& client,
                                   ResponseMeta meta, std::string request_id);

    GatewayConfig config_;
    CorsPolicy cors_;
    LazyBackend backend_;
};

// "data: <json>\n\n"
std::string formatSseEvent(const nlohmann::json& event);

// "data: [DONE]\n\n"
std::string formatSseDone();

}  // namespace sagegate
