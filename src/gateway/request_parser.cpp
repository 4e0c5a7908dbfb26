#include "gateway/request_parser.h"

#include <algorithm>
#include <cctype>

#include "utils/base64.h"
#include "utils/json_utils.h"

namespace sagegate {

namespace {
bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}
}  // namespace

Result<nlohmann::json> parseRequestBody(const InboundRequest& request) {
    std::string decoded;
    const std::string* body = &request.body;
    if (request.is_base64_encoded) {
        std::string error;
        if (!decode_base64(request.body, decoded, error)) {
            return Result<nlohmann::json>::failure(GatewayError::InvalidRequest,
                                                   "Invalid request body: " + error);
        }
        body = &decoded;
    }

    if (isBlank(*body)) {
        return Result<nlohmann::json>::success(nlohmann::json::object());
    }

    std::string parse_error;
    auto parsed = parse_json(*body, &parse_error);
    if (!parsed) {
        return Result<nlohmann::json>::failure(GatewayError::InvalidRequest, "Invalid JSON: " + parse_error);
    }
    if (!parsed->is_object()) {
        return Result<nlohmann::json>::failure(GatewayError::InvalidRequest,
                                               "Invalid JSON: request body must be an object");
    }
    return Result<nlohmann::json>::success(std::move(*parsed));
}

}  // namespace sagegate
