#include "gateway/error_mapper.h"

#include "utils/json_utils.h"

namespace sagegate {

namespace {
constexpr size_t kMaxErrorMessageBytes = 2048;

std::string summarize(const std::string& message) {
    if (message.size() <= kMaxErrorMessageBytes) return message;
    return message.substr(0, kMaxErrorMessageBytes) + "...";
}
}  // namespace

CorsPolicy CorsPolicy::fromConfig(const GatewayConfig& config) {
    CorsPolicy cors;
    cors.allow_origin = config.cors_allow_origin;
    cors.allow_methods = config.cors_allow_methods;
    cors.allow_headers = config.cors_allow_headers;
    return cors;
}

void applyCorsHeaders(HeaderMap& headers, const CorsPolicy& cors) {
    headers.emplace("Access-Control-Allow-Origin", cors.allow_origin);
    headers.emplace("Access-Control-Allow-Methods", cors.allow_methods);
    headers.emplace("Access-Control-Allow-Headers", cors.allow_headers);
}

nlohmann::json makeErrorEnvelope(GatewayError error, const std::string& message) {
    return {{"error", {{"message", summarize(message)}, {"type", to_error_type(error)}}}};
}

GatewayResponse makeJsonResponse(int status, const nlohmann::json& body, const CorsPolicy& cors) {
    GatewayResponse res;
    res.status = status;
    res.headers.emplace("Content-Type", "application/json");
    applyCorsHeaders(res.headers, cors);
    res.body = json_to_string(body);
    return res;
}

GatewayResponse makeErrorResponse(GatewayError error, const std::string& message, const CorsPolicy& cors) {
    if (error == GatewayError::None) {
        error = GatewayError::ServerError;
    }
    return makeJsonResponse(to_http_status(error), makeErrorEnvelope(error, message), cors);
}

}  // namespace sagegate
