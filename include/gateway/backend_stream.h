#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>

#include "backend/backend_client.h"

namespace sagegate {

/// Runs BackendClient::generateStream on a worker thread and hands the decoded
/// events to the consumer one at a time. Lets the caller wait for the first
/// event (or the failure) before committing to a response status.
class BackendStream {
public:
    static constexpr size_t kMaxQueuedEvents = 256;

    BackendStream(BackendClient& client, BackendPayload payload);
    ~BackendStream();

    BackendStream(const BackendStream&) = delete;
    BackendStream& operator=(const BackendStream&) = delete;

    /// Blocks until the next event arrives or the backend call returns.
    /// Returns false once the stream is over; outcome() is final then.
    bool next(nlohmann::json& event);

    /// Closes the backend channel at its next event. Idempotent.
    void cancel();

    const Result<void>& outcome() const { return outcome_; }

private:
    void run(BackendClient& client, const BackendPayload& payload);

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> events_;
    bool finished_{false};
    bool cancelled_{false};
    Result<void> outcome_{Result<void>::success()};
    std::thread worker_;
};

}  // namespace sagegate
