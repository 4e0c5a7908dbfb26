#include "utils/json_utils.h"

namespace sagegate {

std::optional<nlohmann::json> parse_json(std::string_view body, std::string* error) {
    try {
        return nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::parse_error& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

std::string json_to_string(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace sagegate
