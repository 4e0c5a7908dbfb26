#pragma once

#include <httplib.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace sagegate {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;  // always starts with '/'
};

std::optional<HttpUrl> parseHttpUrl(const std::string& url);

// "host" for default ports, "host:port" otherwise (the value of the Host header).
std::string hostHeaderValue(const HttpUrl& url);

// Joins a base path ("/", "/prefix", "/prefix/") with a sub path ("/generate").
std::string joinUrlPath(const std::string& base, const std::string& sub);

// Returns nullptr when the scheme is unsupported by this build.
std::unique_ptr<httplib::Client> makeHttpClient(const HttpUrl& url, std::chrono::milliseconds timeout);

}  // namespace sagegate
