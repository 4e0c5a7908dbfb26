#pragma once

#include <functional>
#include <map>
#include <string>

namespace sagegate {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

// Header names compare case-insensitively.
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

enum class HttpMethod {
    Get,
    Post,
    Options,
    Other,
};

HttpMethod parse_http_method(const std::string& method);

struct InboundRequest {
    std::string method{"POST"};
    std::string path{"/"};
    HeaderMap headers;
    std::string body;                // raw bytes, base64 text when is_base64_encoded
    bool is_base64_encoded{false};

    HttpMethod method_kind() const { return parse_http_method(method); }
};

struct InvocationContext {
    std::string request_id;  // empty: the gateway generates a UUID
};

// Writes one piece of a streamed body. Returns false once the receiver is gone.
using ChunkWriter = std::function<bool(const std::string& data)>;

// Produces a streamed body by calling the writer until done.
using StreamBody = std::function<void(const ChunkWriter& write)>;

struct GatewayResponse {
    int status{200};
    HeaderMap headers;
    std::string body;
    StreamBody stream;  // set for server-sent-event responses; body is empty then

    bool is_streaming() const { return static_cast<bool>(stream); }
};

}  // namespace sagegate
