#pragma once

#include <nlohmann/json.hpp>

#include "core/gateway_error.h"
#include "gateway/types.h"

namespace sagegate {

struct LambdaInvocation {
    InboundRequest request;
    InvocationContext context;
};

/// Reads an API Gateway proxy event (HTTP API v2 or REST v1 layout).
/// Missing fields fall back to POST, "/" and an empty body.
Result<LambdaInvocation> fromLambdaEvent(const nlohmann::json& event);

/// {"statusCode", "headers", "body"}. A streamed body is drained into "body".
nlohmann::json toLambdaResponse(const GatewayResponse& response);

}  // namespace sagegate
