#include "gateway/gateway.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

#include "gateway/backend_stream.h"
#include "gateway/request_parser.h"
#include "utils/json_utils.h"
#include "utils/request_id.h"

namespace sagegate {

using json = nlohmann::json;

std::string formatSseEvent(const json& event) {
    return "data: " + json_to_string(event) + "\n\n";
}

std::string formatSseDone() {
    return "data: [DONE]\n\n";
}

Gateway::Gateway(GatewayConfig config)
    : config_(std::move(config)),
      cors_(CorsPolicy::fromConfig(config_)),
      backend_([cfg = config_]() { return createBackendClient(cfg); }) {}

Gateway::Gateway(GatewayConfig config, BackendFactory factory)
    : config_(std::move(config)), cors_(CorsPolicy::fromConfig(config_)), backend_(std::move(factory)) {}

GatewayResponse Gateway::handle(const InboundRequest& request, const InvocationContext& context) {
    const std::string request_id = context.request_id.empty() ? generate_uuid() : context.request_id;
    try {
        return dispatch(request, request_id);
    } catch (const std::exception& e) {
        spdlog::error("[{}] unhandled error on {} {}: {}", request_id, request.method, request.path, e.what());
        return makeErrorResponse(GatewayError::ServerError, std::string("Internal error: ") + e.what(), cors_);
    }
}

GatewayResponse Gateway::dispatch(const InboundRequest& request, const std::string& request_id) {
    const HttpMethod method = request.method_kind();
    if (method == HttpMethod::Get && request.path.find("/models") != std::string::npos) {
        return handleModels();
    }
    if (method == HttpMethod::Options) {
        return handlePreflight();
    }
    if (method == HttpMethod::Post) {
        return handleCompletion(request, request_id);
    }
    return makeErrorResponse(GatewayError::NotFound, "Not found", cors_);
}

GatewayResponse Gateway::handleModels() const {
    json body = {
        {"object", "list"},
        {"data", json::array({{
            {"id", config_.endpoint_name},
            {"object", "model"},
            {"created", kModelCreated},
            {"owned_by", kModelOwner}
        }})}
    };
    return makeJsonResponse(200, body, cors_);
}

GatewayResponse Gateway::handlePreflight() const {
    GatewayResponse res;
    res.status = 200;
    applyCorsHeaders(res.headers, cors_);
    return res;
}

GatewayResponse Gateway::handleCompletion(const InboundRequest& request, const std::string& request_id) {
    auto payload = parseRequestBody(request);
    if (!payload.ok()) {
        return makeErrorResponse(payload.error, payload.error_message, cors_);
    }
    auto translated = translateRequest(*payload.data);
    if (!translated.ok()) {
        return makeErrorResponse(translated.error, translated.error_message, cors_);
    }

    if (config_.endpoint_name.empty()) {
        spdlog::error("[{}] SAGEMAKER_ENDPOINT_NAME not configured", request_id);
        return makeErrorResponse(GatewayError::ServerError, "SAGEMAKER_ENDPOINT_NAME not configured", cors_);
    }
    auto backend = backend_.get();
    if (!backend.ok()) {
        spdlog::error("[{}] backend unavailable: {}", request_id, backend.error_message);
        return makeErrorResponse(backend.error, backend.error_message, cors_);
    }

    ResponseMeta meta;
    meta.id = makeResponseId(translated.data->shape, request_id);
    meta.model = config_.endpoint_name;
    meta.created = currentUnixTimestamp();

    if (translated.data->stream) {
        return completeStream(std::move(*translated.data), **backend.data, std::move(meta), request_id);
    }
    return completeSync(*translated.data, **backend.data, meta, request_id);
}

GatewayResponse Gateway::completeSync(const TranslatedRequest& request, BackendClient& client,
                                      const ResponseMeta& meta, const std::string& request_id) {
    auto generated = client.generate(request.toBackendPayload());
    if (!generated.ok()) {
        spdlog::warn("[{}] backend {}: {}", request_id, to_error_type(generated.error), generated.error_message);
        return makeErrorResponse(generated.error, generated.error_message, cors_);
    }
    spdlog::debug("[{}] generated {} bytes", request_id, generated.data->size());
    return makeJsonResponse(200, buildCompletionResponse(request, *generated.data, meta), cors_);
}

GatewayResponse Gateway::completeStream(TranslatedRequest request, BackendClient& client,
                                        ResponseMeta meta, std::string request_id) {
    auto stream = std::make_shared<BackendStream>(client, request.toBackendPayload());

    // Hold the status until the backend produced text or gave up.
    std::string pending;
    json event;
    while (pending.empty() && stream->next(event)) {
        pending = extractStreamText(event);
    }
    if (pending.empty() && !stream->outcome().ok()) {
        const auto& failed = stream->outcome();
        spdlog::warn("[{}] backend stream {}: {}", request_id, to_error_type(failed.error), failed.error_message);
        return makeErrorResponse(failed.error, failed.error_message, cors_);
    }

    GatewayResponse res;
    res.status = 200;
    res.headers.emplace("Content-Type", "text/event-stream");
    res.headers.emplace("Cache-Control", "no-cache");
    applyCorsHeaders(res.headers, cors_);

    res.stream = [request = std::move(request), meta = std::move(meta), request_id = std::move(request_id),
                  stream, pending = std::move(pending)](const ChunkWriter& write) {
        try {
            std::string generated;
            std::string text = pending;
            bool first = true;
            json next_event;
            while (!text.empty()) {
                generated += text;
                if (!write(formatSseEvent(buildStreamChunk(request.shape, meta, text, first)))) {
                    spdlog::info("[{}] client disconnected, backend stream closed", request_id);
                    stream->cancel();
                    return;
                }
                first = false;
                text.clear();
                while (text.empty() && stream->next(next_event)) {
                    text = extractStreamText(next_event);
                }
            }

            const auto& result = stream->outcome();
            if (!result.ok()) {
                spdlog::warn("[{}] backend stream {}: {}", request_id, to_error_type(result.error),
                             result.error_message);
                if (write(formatSseEvent(makeErrorEnvelope(result.error, result.error_message)))) {
                    write(formatSseDone());
                }
                return;
            }

            if (!write(formatSseEvent(buildFinalStreamChunk(request.shape, meta)))) return;
            if (request.include_usage &&
                !write(formatSseEvent(
                    buildUsageStreamChunk(request.shape, meta, computeUsage(request.prompt, generated))))) {
                return;
            }
            write(formatSseDone());
        } catch (const std::exception& e) {
            spdlog::error("[{}] stream aborted: {}", request_id, e.what());
            stream->cancel();
            const std::string message = std::string("Internal error: ") + e.what();
            try {
                if (write(formatSseEvent(makeErrorEnvelope(GatewayError::ServerError, message)))) {
                    write(formatSseDone());
                }
            } catch (const std::exception& inner) {
                spdlog::error("[{}] could not report stream failure: {}", request_id, inner.what());
            }
        }
    };
    return res;
}

}  // namespace sagegate
