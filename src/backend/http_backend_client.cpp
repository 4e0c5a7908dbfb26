#include "backend/http_backend_client.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "backend/sse_decoder.h"
#include "utils/json_utils.h"

namespace sagegate {

namespace {
constexpr size_t kMaxErrorBodyBytes = 64 * 1024;

GatewayError classifyStatus(int status) {
    return status == 424 ? GatewayError::ModelError : GatewayError::ServerError;
}

std::string failureMessage(GatewayError kind, int status, const std::string& body) {
    const std::string summary = summarizeErrorBody(body);
    if (kind == GatewayError::ModelError) {
        return "Model error: " + summary;
    }
    return "Backend returned HTTP " + std::to_string(status) + (summary.empty() ? "" : ": " + summary);
}
}  // namespace

HttpBackendClient::HttpBackendClient(HttpUrl base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {}

Result<std::unique_ptr<BackendClient>> HttpBackendClient::create(const GatewayConfig& config) {
    using R = Result<std::unique_ptr<BackendClient>>;
    if (config.backend_url.empty()) {
        return R::failure(GatewayError::ServerError, "SAGEGATE_BACKEND_URL not configured");
    }
    auto parsed = parseHttpUrl(config.backend_url);
    if (!parsed) {
        return R::failure(GatewayError::ServerError, "Invalid backend URL: " + config.backend_url);
    }
    std::unique_ptr<BackendClient> client = std::make_unique<HttpBackendClient>(*parsed, config.request_timeout);
    return R::success(std::move(client));
}

std::string HttpBackendClient::describe() const {
    return "http " + base_url_.scheme + "://" + hostHeaderValue(base_url_) + base_url_.path;
}

Result<std::string> HttpBackendClient::generate(const BackendPayload& payload) {
    auto client = makeHttpClient(base_url_, timeout_);
    if (!client) {
        return Result<std::string>::failure(GatewayError::ServerError,
                                            "Unsupported backend URL scheme: " + base_url_.scheme);
    }
    const std::string path = joinUrlPath(base_url_.path, "/generate");
    auto res = client->Post(path, json_to_string(payload.toJson()), "application/json");
    if (!res) {
        return Result<std::string>::failure(GatewayError::ServerError,
                                            "Backend request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        const auto kind = classifyStatus(res->status);
        spdlog::warn("Backend {} failed: status={}", path, res->status);
        return Result<std::string>::failure(kind, failureMessage(kind, res->status, res->body));
    }

    std::string parse_error;
    auto body = parse_json(res->body, &parse_error);
    if (!body) {
        return Result<std::string>::failure(GatewayError::ServerError,
                                            "Invalid response from backend: " + parse_error);
    }
    return Result<std::string>::success(extractGeneratedText(*body));
}

Result<void> HttpBackendClient::generateStream(const BackendPayload& payload, const StreamEventCallback& on_event) {
    auto client = makeHttpClient(base_url_, timeout_);
    if (!client) {
        return Result<void>::failure(GatewayError::ServerError,
                                     "Unsupported backend URL scheme: " + base_url_.scheme);
    }

    int status = 0;
    std::string error_body;
    SseDecoder events;
    Result<void> outcome = Result<void>::success();
    bool stopped = false;

    httplib::Request req;
    req.method = "POST";
    req.path = joinUrlPath(base_url_.path, "/generate_stream");
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "text/event-stream");
    req.body = json_to_string(payload.toJson(true));
    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (status < 200 || status >= 300) {
            if (error_body.size() < kMaxErrorBodyBytes) error_body.append(data, len);
            return true;
        }
        std::vector<nlohmann::json> decoded;
        std::string error;
        if (!events.feed(std::string_view(data, len), decoded, &error)) {
            outcome = Result<void>::failure(GatewayError::ServerError, "Invalid response stream: " + error);
            stopped = true;
            return false;
        }
        for (const auto& event : decoded) {
            if (!on_event(event)) {
                stopped = true;
                return false;
            }
        }
        if (events.done()) {
            stopped = true;
            return false;
        }
        return true;
    };

    auto res = client->send(req);
    if (status != 0 && (status < 200 || status >= 300)) {
        const auto kind = classifyStatus(status);
        spdlog::warn("Backend {} failed: status={}", req.path, status);
        return Result<void>::failure(kind, failureMessage(kind, status, error_body));
    }
    if (stopped) {
        return outcome;
    }
    if (!res) {
        return Result<void>::failure(GatewayError::ServerError,
                                     "Backend stream failed: " + httplib::to_string(res.error()));
    }

    std::vector<nlohmann::json> tail;
    std::string error;
    if (!events.finish(tail, &error)) {
        return Result<void>::failure(GatewayError::ServerError, "Invalid response stream: " + error);
    }
    for (const auto& event : tail) {
        if (!on_event(event)) break;
    }
    return outcome;
}

}  // namespace sagegate
