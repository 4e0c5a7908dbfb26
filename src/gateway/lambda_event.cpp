#include "gateway/lambda_event.h"

#include "utils/json_utils.h"

namespace sagegate {

using json = nlohmann::json;

namespace {

std::string stringField(const json& obj, const char* key) {
    if (!obj.is_object()) return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

const json& objectField(const json& obj, const char* key) {
    static const json kEmpty = json::object();
    if (!obj.is_object()) return kEmpty;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) return kEmpty;
    return *it;
}

}  // namespace

Result<LambdaInvocation> fromLambdaEvent(const json& event) {
    if (!event.is_object()) {
        return Result<LambdaInvocation>::failure(GatewayError::InvalidRequest, "event must be a JSON object");
    }

    LambdaInvocation inv;
    const json& request_context = objectField(event, "requestContext");

    std::string method = stringField(objectField(request_context, "http"), "method");
    if (method.empty()) method = stringField(event, "httpMethod");
    if (!method.empty()) inv.request.method = method;

    std::string path = stringField(event, "rawPath");
    if (path.empty()) path = stringField(event, "path");
    if (!path.empty()) inv.request.path = path;

    for (const auto& [name, value] : objectField(event, "headers").items()) {
        inv.request.headers[name] = value.is_string() ? value.get<std::string>() : json_to_string(value);
    }

    auto body = event.find("body");
    if (body != event.end() && !body->is_null()) {
        // API Gateway always sends a string; tolerate an inline JSON document
        inv.request.body = body->is_string() ? body->get<std::string>() : json_to_string(*body);
    }
    inv.request.is_base64_encoded = get_or<bool>(event, "isBase64Encoded", false);
    inv.context.request_id = stringField(request_context, "requestId");
    return Result<LambdaInvocation>::success(std::move(inv));
}

json toLambdaResponse(const GatewayResponse& response) {
    json headers = json::object();
    for (const auto& [name, value] : response.headers) {
        headers[name] = value;
    }

    std::string body = response.body;
    if (response.is_streaming()) {
        response.stream([&body](const std::string& data) {
            body += data;
            return true;
        });
    }

    return {
        {"statusCode", response.status},
        {"headers", std::move(headers)},
        {"body", std::move(body)}
    };
}

}  // namespace sagegate
