#include "backend/backend_client.h"

#include <cctype>
#include <spdlog/spdlog.h>

#include "backend/http_backend_client.h"
#include "backend/sagemaker_client.h"
#include "utils/json_utils.h"

namespace sagegate {

namespace {
constexpr size_t kMaxErrorSummaryBytes = 512;

std::string trimAscii(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}
}  // namespace

nlohmann::json BackendPayload::toJson(bool stream) const {
    nlohmann::json j = {
        {"inputs", inputs},
        {"parameters", {
            {"max_new_tokens", parameters.max_new_tokens},
            {"temperature", parameters.temperature},
            {"do_sample", parameters.do_sample}
        }}
    };
    if (stream) {
        j["stream"] = true;
    }
    return j;
}

LazyBackend::LazyBackend(BackendFactory factory) : factory_(std::move(factory)) {}

Result<BackendClient*> LazyBackend::get() {
    if (auto* client = instance_.load(std::memory_order_acquire)) {
        return Result<BackendClient*>::success(client);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        if (!factory_) {
            return Result<BackendClient*>::failure(GatewayError::ServerError, "backend is not configured");
        }
        auto created = factory_();
        if (!created.ok()) {
            return Result<BackendClient*>::failure(created.error, created.error_message);
        }
        if (!created.data || !*created.data) {
            return Result<BackendClient*>::failure(GatewayError::ServerError, "backend factory returned no client");
        }
        client_ = std::move(*created.data);
        instance_.store(client_.get(), std::memory_order_release);
        spdlog::info("Backend client initialized: {}", client_->describe());
    }
    return Result<BackendClient*>::success(client_.get());
}

std::string extractGeneratedText(const nlohmann::json& response) {
    const nlohmann::json* obj = &response;
    if (response.is_array()) {
        if (response.empty()) return "";
        obj = &response.front();
    }
    if (!obj->is_object()) return "";
    auto it = obj->find("generated_text");
    if (it == obj->end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::string summarizeErrorBody(const std::string& body) {
    std::string message;
    if (auto j = parse_json(body)) {
        if (j->is_object()) {
            for (const char* key : {"Message", "message", "error"}) {
                auto it = j->find(key);
                if (it == j->end()) continue;
                if (it->is_string()) {
                    message = it->get<std::string>();
                } else if (it->is_object()) {
                    message = get_or<std::string>(*it, "message", "");
                }
                if (!message.empty()) break;
            }
        }
    }
    if (message.empty()) {
        message = trimAscii(body);
    }
    if (message.size() > kMaxErrorSummaryBytes) {
        message = message.substr(0, kMaxErrorSummaryBytes) + "...";
    }
    return message;
}

Result<std::unique_ptr<BackendClient>> createBackendClient(const GatewayConfig& config) {
    switch (config.backend) {
        case BackendKind::SageMaker:
            return SageMakerClient::create(config);
        case BackendKind::Http:
            return HttpBackendClient::create(config);
    }
    return Result<std::unique_ptr<BackendClient>>::failure(GatewayError::ServerError, "unknown backend kind");
}

}  // namespace sagegate
