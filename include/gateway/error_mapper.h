#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "core/gateway_error.h"
#include "gateway/types.h"
#include "utils/config.h"

namespace sagegate {

struct CorsPolicy {
    std::string allow_origin{"*"};
    std::string allow_methods{"GET, POST, OPTIONS"};
    std::string allow_headers{"Content-Type, Authorization"};

    static CorsPolicy fromConfig(const GatewayConfig& config);
};

// Adds the CORS headers that are not already present.
void applyCorsHeaders(HeaderMap& headers, const CorsPolicy& cors);

// {"error": {"message": ..., "type": ...}}
nlohmann::json makeErrorEnvelope(GatewayError error, const std::string& message);

GatewayResponse makeJsonResponse(int status, const nlohmann::json& body, const CorsPolicy& cors);

// Status and type follow the taxonomy (400 / 404 / 500).
GatewayResponse makeErrorResponse(GatewayError error, const std::string& message, const CorsPolicy& cors);

}  // namespace sagegate
