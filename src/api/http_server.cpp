#include "api/http_server.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include "gateway/error_mapper.h"
#include "gateway/gateway.h"
#include "utils/json_utils.h"
#include "utils/request_id.h"

namespace sagegate {

namespace {
constexpr const char* kRequestIdHeader = "X-Request-Id";
constexpr const char* kAnyPath = ".*";

bool accepts_gzip(const httplib::Request& req) {
    if (!req.has_header("Accept-Encoding")) return false;
    auto enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

std::string gzip_compress(const std::string& input) {
    if (input.empty()) return {};

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());

    std::string output;
    output.reserve(input.size() / 2);
    char buffer[32768];

    int ret = Z_OK;
    while (ret == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = static_cast<uInt>(sizeof(buffer));
        ret = deflate(&zs, zs.avail_in ? Z_NO_FLUSH : Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return {};
        }
        const size_t written = sizeof(buffer) - zs.avail_out;
        if (written > 0) {
            output.append(buffer, written);
        }
    }

    deflateEnd(&zs);
    return output;
}

void setErrorBody(httplib::Response& res, GatewayError error, const std::string& message, const CorsPolicy& cors) {
    const GatewayResponse mapped = makeErrorResponse(error, message, cors);
    for (const auto& [name, value] : mapped.headers) {
        if (name == "Content-Type" || res.has_header(name)) continue;
        res.set_header(name, value);
    }
    res.set_content(mapped.body, "application/json");
}
}  // namespace

InboundRequest toInboundRequest(const httplib::Request& req) {
    InboundRequest in;
    in.method = req.method;
    in.path = req.path;
    for (const auto& [name, value] : req.headers) {
        in.headers.emplace(name, value);
    }
    in.body = req.body;
    in.is_base64_encoded = false;
    return in;
}

void logAccess(const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {} id={}", req.method, req.path, res.status, res.get_header_value(kRequestIdHeader));
}

HttpServer::HttpServer(int port, Gateway& gateway, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), gateway_(gateway) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::handle(const httplib::Request& req, httplib::Response& res) {
    std::string request_id = req.get_header_value(kRequestIdHeader);
    if (request_id.empty()) request_id = generate_uuid();
    res.set_header(kRequestIdHeader, request_id);

    InvocationContext ctx;
    ctx.request_id = request_id;
    GatewayResponse out = gateway_.handle(toInboundRequest(req), ctx);

    res.status = out.status;
    std::string content_type = "application/json";
    for (const auto& [name, value] : out.headers) {
        if (name == "Content-Type") {
            content_type = value;
            continue;
        }
        res.set_header(name, value);
    }

    if (out.is_streaming()) {
        StreamBody stream = std::move(out.stream);
        res.set_chunked_content_provider(content_type,
            [stream](size_t /*offset*/, httplib::DataSink& sink) {
                stream([&sink](const std::string& data) {
                    return sink.is_writable() && sink.write(data.data(), data.size());
                });
                sink.done();
                return true;
            });
        return;
    }
    if (!out.body.empty()) {
        res.set_content(out.body, content_type);
    }
}

void HttpServer::start() {
    if (running_) return;

    auto handler = [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); };
    server_.Get(kAnyPath, handler);
    server_.Post(kAnyPath, handler);
    server_.Put(kAnyPath, handler);
    server_.Patch(kAnyPath, handler);
    server_.Delete(kAnyPath, handler);
    server_.Options(kAnyPath, handler);

    // Post-routing: gzip for buffered bodies only
    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!enable_compression_) return;
        if (!accepts_gzip(req)) return;
        if (res.body.empty()) return;
        if (res.has_header("Content-Encoding")) return;

        auto compressed = gzip_compress(res.body);
        if (compressed.empty()) return;

        const auto content_type = res.get_header_value("Content-Type");
        res.set_content(compressed,
                        content_type.empty() ? "application/octet-stream" : content_type);
        auto range = res.headers.equal_range("Content-Length");
        res.headers.erase(range.first, range.second);
        res.set_header("Content-Length", std::to_string(compressed.size()));
        res.set_header("Content-Encoding", "gzip");
        res.set_header("Vary", "Accept-Encoding");
    });

    server_.set_logger(logAccess);

    // Requests httplib rejects before routing (unrouted method, oversized payload)
    server_.set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            if (!res.has_header("Content-Type")) {
                res.set_header("Content-Type", "text/plain");
            }
            return;
        }
        // Unroutable methods and malformed request lines look like any other unknown route.
        if (res.status == 413) {
            setErrorBody(res, GatewayError::InvalidRequest, "Request body too large", gateway_.cors());
        } else if (res.status >= 500) {
            setErrorBody(res, GatewayError::ServerError, "HTTP error " + std::to_string(res.status), gateway_.cors());
        } else {
            res.status = 404;
            setErrorBody(res, GatewayError::NotFound, "Not found", gateway_.cors());
        }
    });

    server_.set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown";
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            }
        }
        spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, what);
        res.status = 500;
        setErrorBody(res, GatewayError::ServerError, "Internal error: " + what, gateway_.cors());
    });

    if (port_ == 0) {
        port_ = server_.bind_to_any_port(bind_address_);
        if (port_ <= 0) {
            throw std::runtime_error("failed to bind " + bind_address_ + " to an ephemeral port");
        }
    } else if (!server_.bind_to_port(bind_address_, port_)) {
        throw std::runtime_error("failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    spdlog::info("Listening on {}:{}", bind_address_, port_);
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace sagegate
