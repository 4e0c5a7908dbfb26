#pragma once

#include <httplib.h>
#include <atomic>
#include <string>
#include <thread>

#include "gateway/types.h"

namespace sagegate {

class Gateway;

/// Serves every method and path through the gateway on a background thread.
class HttpServer {
public:
    // port 0 binds an ephemeral port (see port() after start()).
    HttpServer(int port, Gateway& gateway, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Throws std::runtime_error when the address cannot be bound.
    void start();
    void stop();

    void enableCompression(bool enable) { enable_compression_ = enable; }

    int port() const { return port_; }
    bool running() const { return running_; }

private:
    void handle(const httplib::Request& req, httplib::Response& res);

    int port_;
    std::string bind_address_;
    Gateway& gateway_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    bool enable_compression_{true};
};

// Copies method, path, headers and body; the body is never base64 here.
InboundRequest toInboundRequest(const httplib::Request& req);

// "<method> <path> <status>" at info level.
void logAccess(const httplib::Request& req, const httplib::Response& res);

}  // namespace sagegate
