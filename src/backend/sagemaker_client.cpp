#include "backend/sagemaker_client.h"

#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/sagemaker-runtime/model/InvokeEndpointRequest.h>
#include <aws/sagemaker-runtime/model/InvokeEndpointWithResponseStreamHandler.h>
#include <aws/sagemaker-runtime/model/InvokeEndpointWithResponseStreamRequest.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <sstream>
#include <vector>

#include "backend/aws_sdk.h"
#include "backend/sse_decoder.h"
#include "utils/http_url.h"
#include "utils/json_utils.h"

namespace sagegate {

namespace {
constexpr const char* kAllocationTag = "sagegate";
constexpr const char* kJsonContentType = "application/json";
constexpr int kModelErrorStatus = 424;

std::shared_ptr<Aws::IOStream> jsonBody(const nlohmann::json& body) {
    auto stream = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
    *stream << json_to_string(body);
    return stream;
}
}  // namespace

GatewayError classifySageMakerFailure(int status, const std::string& exception_name) {
    if (status == kModelErrorStatus || exception_name.rfind("ModelError", 0) == 0 ||
        exception_name == "ModelStreamError") {
        return GatewayError::ModelError;
    }
    return GatewayError::ServerError;
}

Result<void> sageMakerFailure(const Aws::Client::AWSError<Aws::SageMakerRuntime::SageMakerRuntimeErrors>& error) {
    const int status = static_cast<int>(error.GetResponseCode());
    const std::string name(error.GetExceptionName().c_str());
    const std::string message(error.GetMessage().c_str());
    auto kind = classifySageMakerFailure(status, name);
    // Stream exceptions may carry only the modeled type.
    const auto type = error.GetErrorType();
    if (type == Aws::SageMakerRuntime::SageMakerRuntimeErrors::MODEL ||
        type == Aws::SageMakerRuntime::SageMakerRuntimeErrors::MODEL_STREAM) {
        kind = GatewayError::ModelError;
    }
    if (kind == GatewayError::ModelError) {
        return Result<void>::failure(kind, "Model error: " + message);
    }
    std::string text = "SageMaker runtime error";
    if (!name.empty()) text += " " + name;
    if (status > 0) text += " (HTTP " + std::to_string(status) + ")";
    if (!message.empty()) text += ": " + message;
    return Result<void>::failure(kind, text);
}

Result<Aws::Client::ClientConfiguration> makeSageMakerClientConfiguration(const GatewayConfig& config) {
    using R = Result<Aws::Client::ClientConfiguration>;
    ensureAwsSdkInitialized();

    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;
    client_config.requestTimeoutMs = static_cast<long>(config.request_timeout.count());
    // The caller decides whether to retry a failed generation.
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, 0);

    if (!config.backend_url.empty()) {
        auto parsed = parseHttpUrl(config.backend_url);
        if (!parsed) {
            return R::failure(GatewayError::ServerError, "Invalid SageMaker runtime URL: " + config.backend_url);
        }
        client_config.endpointOverride = config.backend_url;
        client_config.scheme = parsed->scheme == "http" ? Aws::Http::Scheme::HTTP : Aws::Http::Scheme::HTTPS;
    }
    return R::success(std::move(client_config));
}

SageMakerClient::SageMakerClient(std::string endpoint_name, const Aws::Client::ClientConfiguration& client_config)
    : endpoint_name_(std::move(endpoint_name)),
      region_(client_config.region.c_str()),
      endpoint_override_(client_config.endpointOverride.c_str()),
      client_(std::make_unique<Aws::SageMakerRuntime::SageMakerRuntimeClient>(client_config)) {}

Result<std::unique_ptr<BackendClient>> SageMakerClient::create(const GatewayConfig& config) {
    using R = Result<std::unique_ptr<BackendClient>>;
    if (config.endpoint_name.empty()) {
        return R::failure(GatewayError::ServerError, "SAGEMAKER_ENDPOINT_NAME not configured");
    }
    auto client_config = makeSageMakerClientConfiguration(config);
    if (!client_config.ok()) {
        return R::failure(client_config.error, client_config.error_message);
    }
    std::unique_ptr<BackendClient> client =
        std::make_unique<SageMakerClient>(config.endpoint_name, *client_config.data);
    return R::success(std::move(client));
}

std::string SageMakerClient::describe() const {
    std::string out = "sagemaker endpoint=" + endpoint_name_ + " region=" + region_;
    if (!endpoint_override_.empty()) out += " runtime=" + endpoint_override_;
    return out;
}

Result<std::string> SageMakerClient::generate(const BackendPayload& payload) {
    Aws::SageMakerRuntime::Model::InvokeEndpointRequest request;
    request.SetEndpointName(endpoint_name_.c_str());
    request.SetContentType(kJsonContentType);
    request.SetAccept(kJsonContentType);
    request.SetBody(jsonBody(payload.toJson()));

    auto outcome = client_->InvokeEndpoint(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        spdlog::warn("SageMaker InvokeEndpoint failed: status={} error={} endpoint={}",
                     static_cast<int>(error.GetResponseCode()), error.GetExceptionName().c_str(), endpoint_name_);
        auto failed = sageMakerFailure(error);
        return Result<std::string>::failure(failed.error, failed.error_message);
    }

    std::ostringstream raw;
    raw << outcome.GetResult().GetBody().rdbuf();
    std::string parse_error;
    auto body = parse_json(raw.str(), &parse_error);
    if (!body) {
        return Result<std::string>::failure(GatewayError::ServerError,
                                            "Invalid response from backend: " + parse_error);
    }
    return Result<std::string>::success(extractGeneratedText(*body));
}

Result<void> SageMakerClient::generateStream(const BackendPayload& payload, const StreamEventCallback& on_event) {
    using namespace Aws::SageMakerRuntime;

    SseDecoder events;
    Result<void> outcome = Result<void>::success();
    std::atomic<bool> stopped{false};  // set once reading must end before the transport does

    // Returns false to stop reading.
    auto deliver = [&](std::vector<nlohmann::json>& decoded) {
        for (const auto& event : decoded) {
            if (!on_event(event)) return false;
        }
        decoded.clear();
        return !events.done();
    };

    Model::InvokeEndpointWithResponseStreamHandler handler;
    handler.SetPayloadPartCallback([&](const Model::PayloadPart& part) {
        if (stopped) return;
        const auto& bytes = part.GetBytes();
        std::vector<nlohmann::json> decoded;
        std::string error;
        if (!events.feed(std::string_view(reinterpret_cast<const char*>(bytes.GetUnderlyingData()),
                                          bytes.GetLength()),
                         decoded, &error)) {
            outcome = Result<void>::failure(GatewayError::ServerError, "Invalid response stream: " + error);
            stopped = true;
            return;
        }
        if (!deliver(decoded)) stopped = true;
    });
    handler.SetOnErrorCallback([&](const Aws::Client::AWSError<SageMakerRuntimeErrors>& error) {
        if (stopped) return;
        spdlog::warn("SageMaker response stream error: {} endpoint={}", error.GetExceptionName().c_str(),
                     endpoint_name_);
        outcome = sageMakerFailure(error);
        stopped = true;
    });

    Model::InvokeEndpointWithResponseStreamRequest request;
    request.SetEndpointName(endpoint_name_.c_str());
    request.SetContentType(kJsonContentType);
    request.SetAccept(kJsonContentType);
    request.SetBody(jsonBody(payload.toJson(true)));
    request.SetEventStreamHandler(handler);
    // Closes the connection once the consumer is gone or the stream is unusable.
    request.SetContinueRequestHandler([&stopped](const Aws::Http::HttpRequest*) { return !stopped.load(); });

    auto result = client_->InvokeEndpointWithResponseStream(request);
    if (stopped) {
        return outcome;
    }
    if (!result.IsSuccess()) {
        const auto& error = result.GetError();
        spdlog::warn("SageMaker InvokeEndpointWithResponseStream failed: status={} error={} endpoint={}",
                     static_cast<int>(error.GetResponseCode()), error.GetExceptionName().c_str(), endpoint_name_);
        return sageMakerFailure(error);
    }

    std::vector<nlohmann::json> tail;
    std::string error;
    if (!events.finish(tail, &error)) {
        return Result<void>::failure(GatewayError::ServerError, "Invalid response stream: " + error);
    }
    deliver(tail);
    return outcome;
}

}  // namespace sagegate
