#pragma once

#include <nlohmann/json.hpp>

#include "core/gateway_error.h"
#include "gateway/types.h"

namespace sagegate {

// Decodes the body (base64 when flagged) and parses it as a JSON object.
// An empty body yields an empty object. Bad base64, malformed JSON and
// non-object documents fail with InvalidRequest.
Result<nlohmann::json> parseRequestBody(const InboundRequest& request);

}  // namespace sagegate
