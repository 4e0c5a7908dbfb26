#include "gateway/backend_stream.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace sagegate {

BackendStream::BackendStream(BackendClient& client, BackendPayload payload) {
    worker_ = std::thread([this, &client, payload = std::move(payload)]() { run(client, payload); });
}

BackendStream::~BackendStream() {
    cancel();
    if (worker_.joinable()) worker_.join();
}

void BackendStream::run(BackendClient& client, const BackendPayload& payload) {
    Result<void> result;
    try {
        result = client.generateStream(payload, [this](const nlohmann::json& event) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return cancelled_ || events_.size() < kMaxQueuedEvents; });
            if (cancelled_) return false;
            events_.push_back(event);
            cv_.notify_all();
            return true;
        });
    } catch (const std::exception& e) {
        spdlog::error("backend stream threw: {}", e.what());
        result = Result<void>::failure(GatewayError::ServerError, std::string("Internal error: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    outcome_ = std::move(result);
    finished_ = true;
    cv_.notify_all();
}

bool BackendStream::next(nlohmann::json& event) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return finished_ || !events_.empty(); });
    if (events_.empty()) return false;
    event = std::move(events_.front());
    events_.pop_front();
    cv_.notify_all();
    return true;
}

void BackendStream::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    events_.clear();
    cv_.notify_all();
}

}  // namespace sagegate
