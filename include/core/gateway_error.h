#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sagegate {

// Error taxonomy shared by every layer. Mapped to the wire envelope only at
// the gateway boundary.
enum class GatewayError {
    None = 0,
    InvalidRequest,  // malformed client input (400)
    ModelError,      // backend reported a generation-time fault (500)
    ServerError,     // transport, configuration, anything unexpected (500)
    NotFound,        // unroutable request (404)
};

// Wire-level "type" string of the error envelope.
inline const char* to_error_type(GatewayError error) {
    switch (error) {
        case GatewayError::None:
            return "none";
        case GatewayError::InvalidRequest:
            return "invalid_request_error";
        case GatewayError::ModelError:
            return "model_error";
        case GatewayError::ServerError:
            return "server_error";
        case GatewayError::NotFound:
            return "not_found";
    }
    return "server_error";
}

inline int to_http_status(GatewayError error) {
    switch (error) {
        case GatewayError::None:
            return 200;
        case GatewayError::InvalidRequest:
            return 400;
        case GatewayError::NotFound:
            return 404;
        case GatewayError::ModelError:
        case GatewayError::ServerError:
            return 500;
    }
    return 500;
}

/// Value or error kind + human-readable message.
template <typename T>
struct Result {
    GatewayError error{GatewayError::None};
    std::string error_message;
    std::optional<T> data;

    bool ok() const { return error == GatewayError::None; }

    static Result success(T value) {
        Result r;
        r.data = std::move(value);
        return r;
    }

    static Result failure(GatewayError error, std::string message) {
        Result r;
        r.error = error;
        r.error_message = std::move(message);
        return r;
    }
};

/// Specialization for void type (no data member)
template <>
struct Result<void> {
    GatewayError error{GatewayError::None};
    std::string error_message;

    bool ok() const { return error == GatewayError::None; }

    static Result success() { return {}; }

    static Result failure(GatewayError error, std::string message) {
        Result r;
        r.error = error;
        r.error_message = std::move(message);
        return r;
    }
};

}  // namespace sagegate
