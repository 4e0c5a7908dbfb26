#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "core/gateway_error.h"
#include "utils/config.h"

namespace sagegate {

struct GenerationParameters {
    int max_new_tokens{100};
    double temperature{0.7};
    bool do_sample{true};  // greedy decoding is never requested
};

// The only request shape the backend understands. It has no notion of roles.
struct BackendPayload {
    std::string inputs;
    GenerationParameters parameters;

    // {"inputs":..., "parameters":{...}} plus "stream": true for streaming calls.
    nlohmann::json toJson(bool stream = false) const;
};

// Receives one decoded backend event. Returning false stops the stream and
// closes the backend channel.
using StreamEventCallback = std::function<bool(const nlohmann::json& event)>;

/// Transport boundary. Callers never see HTTP, signing or framing details.
class BackendClient {
public:
    virtual ~BackendClient() = default;

    /// One round trip; the whole generated text arrives at once.
    virtual Result<std::string> generate(const BackendPayload& payload) = 0;

    /// Opens a response stream and delivers each decoded event in order.
    /// Returns after the end marker, the end of the stream, an error, or the
    /// callback returning false. The channel is closed in every case.
    virtual Result<void> generateStream(const BackendPayload& payload,
                                        const StreamEventCallback& on_event) = 0;

    virtual std::string describe() const = 0;
};

using BackendFactory = std::function<Result<std::unique_ptr<BackendClient>>()>;

/// Process-wide backend handle, created on first use and then shared
/// read-only. A failed creation is reported to that caller and retried by the
/// next one.
class LazyBackend {
public:
    explicit LazyBackend(BackendFactory factory);

    LazyBackend(const LazyBackend&) = delete;
    LazyBackend& operator=(const LazyBackend&) = delete;

    Result<BackendClient*> get();

    bool initialized() const { return instance_.load(std::memory_order_acquire) != nullptr; }

private:
    BackendFactory factory_;
    std::mutex mutex_;
    std::unique_ptr<BackendClient> client_;
    std::atomic<BackendClient*> instance_{nullptr};
};

// Generated text of a sync response: {"generated_text": ...} or
// [{"generated_text": ...}]. Missing field yields an empty string.
std::string extractGeneratedText(const nlohmann::json& response);

// Short human-readable message from a backend error body (JSON or text).
std::string summarizeErrorBody(const std::string& body);

// Builds the client selected by the configuration.
Result<std::unique_ptr<BackendClient>> createBackendClient(const GatewayConfig& config);

}  // namespace sagegate
