#include "utils/http_url.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace sagegate {

std::optional<HttpUrl> parseHttpUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:?#]+)(?::(\d+))?([^?#]*).*$)");
    std::smatch match;
    if (!std::regex_match(url, match, re)) {
        return std::nullopt;
    }
    HttpUrl parsed;
    parsed.scheme = match[1].str();
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return std::nullopt;
    }
    parsed.host = match[2].str();
    try {
        parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (parsed.port <= 0 || parsed.port > 65535) {
        return std::nullopt;
    }
    parsed.path = match[4].str().empty() ? "/" : match[4].str();
    return parsed;
}

std::string hostHeaderValue(const HttpUrl& url) {
    const bool default_port = (url.scheme == "https" && url.port == 443) ||
                              (url.scheme == "http" && url.port == 80);
    if (default_port) return url.host;
    return url.host + ":" + std::to_string(url.port);
}

std::string joinUrlPath(const std::string& base, const std::string& sub) {
    std::string out = base;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (sub.empty() || sub.front() != '/') out.push_back('/');
    out += sub;
    return out;
}

std::unique_ptr<httplib::Client> makeHttpClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (url.scheme.empty() || url.host.empty()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;
    }
#endif

    std::string scheme_host_port = url.scheme + "://" + url.host + ":" + std::to_string(url.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (!client->is_valid()) {
        return nullptr;
    }
    const int sec = static_cast<int>(timeout.count() / 1000);
    const int usec = static_cast<int>((timeout.count() % 1000) * 1000);
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    client->set_write_timeout(sec, usec);
    return client;
}

}  // namespace sagegate
