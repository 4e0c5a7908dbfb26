#include "utils/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sagegate {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<std::string> getEnvWithFallback(const char* name, const char* fallback_name) {
    if (auto v = getEnvValue(name)) {
        if (!v->empty()) return v;
    }
    if (auto v = getEnvValue(fallback_name)) {
        if (!v->empty()) return v;
    }
    return std::nullopt;
}

// Whole string must be a base-10 integer; "8080abc" is rejected.
std::optional<long long> parseWholeInteger(const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<BackendKind> parseBackendKind(const std::string& text) {
    const auto lower = toLowerAscii(text);
    if (lower == "sagemaker") return BackendKind::SageMaker;
    if (lower == "http") return BackendKind::Http;
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    auto home = getEnvValue("HOME").value_or("");
    if (home.empty()) return {};
    return std::filesystem::path(home) / ".sagegate" / "config.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config file {}: {}", path.string(), e.what());
        return false;
    }
}

}  // namespace

const char* to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::SageMaker:
            return "sagemaker";
        case BackendKind::Http:
            return "http";
    }
    return "unknown";
}

std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog() {
    GatewayConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    auto apply_json = [&](const nlohmann::json& j) {
        if (!j.is_object()) return;
        if (j.contains("endpoint_name") && j["endpoint_name"].is_string()) {
            cfg.endpoint_name = j["endpoint_name"].get<std::string>();
        }
        if (j.contains("region") && j["region"].is_string()) {
            cfg.region = j["region"].get<std::string>();
        }
        if (j.contains("backend") && j["backend"].is_string()) {
            if (auto kind = parseBackendKind(j["backend"].get<std::string>())) {
                cfg.backend = *kind;
            }
        }
        if (j.contains("backend_url") && j["backend_url"].is_string()) {
            cfg.backend_url = j["backend_url"].get<std::string>();
        }
        if (j.contains("port") && j["port"].is_number_integer()) {
            cfg.port = j["port"].get<int>();
        }
        if (j.contains("bind_address") && j["bind_address"].is_string()) {
            cfg.bind_address = j["bind_address"].get<std::string>();
        }
        if (j.contains("request_timeout_ms") && j["request_timeout_ms"].is_number_integer()) {
            auto ms = j["request_timeout_ms"].get<int64_t>();
            if (ms > 0) cfg.request_timeout = std::chrono::milliseconds(ms);
        }
        cfg.cors_allow_origin = j.value("cors_allow_origin", cfg.cors_allow_origin);
        cfg.cors_allow_methods = j.value("cors_allow_methods", cfg.cors_allow_methods);
        cfg.cors_allow_headers = j.value("cors_allow_headers", cfg.cors_allow_headers);
        cfg.gzip_enabled = j.value("gzip_enabled", cfg.gzip_enabled);
    };

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("SAGEGATE_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            try {
                apply_json(j);
                log << "file=" << cfg_path << " ";
                used_file = true;
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Ignoring config file {}: {}", cfg_path.string(), e.what());
            }
        }
    }

    if (auto v = getEnvValue("SAGEMAKER_ENDPOINT_NAME")) {
        cfg.endpoint_name = *v;
        log << "env:ENDPOINT_NAME=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("AWS_REGION", "AWS_DEFAULT_REGION")) {
        cfg.region = *v;
        log << "env:REGION=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("SAGEGATE_BACKEND")) {
        if (auto kind = parseBackendKind(*v)) {
            cfg.backend = *kind;
            log << "env:BACKEND=" << *v << " ";
            used_env = true;
        } else {
            spdlog::warn("Unknown SAGEGATE_BACKEND '{}', keeping {}", *v, to_string(cfg.backend));
        }
    }
    if (auto v = getEnvValue("SAGEGATE_BACKEND_URL")) {
        cfg.backend_url = *v;
        log << "env:BACKEND_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("SAGEGATE_PORT")) {
        auto port = parseWholeInteger(*v);
        if (port && *port > 0 && *port <= 65535) {
            cfg.port = static_cast<int>(*port);
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid SAGEGATE_PORT '{}'", *v);
        }
    }
    if (auto v = getEnvValue("SAGEGATE_BIND_ADDRESS")) {
        cfg.bind_address = *v;
        log << "env:BIND_ADDRESS=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("SAGEGATE_REQUEST_TIMEOUT_MS")) {
        auto ms = parseWholeInteger(*v);
        if (ms && *ms > 0) {
            cfg.request_timeout = std::chrono::milliseconds(*ms);
            log << "env:REQUEST_TIMEOUT_MS=" << *ms << " ";
            used_env = true;
        } else {
            spdlog::warn("Ignoring invalid SAGEGATE_REQUEST_TIMEOUT_MS '{}'", *v);
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

GatewayConfig loadGatewayConfig() {
    return loadGatewayConfigWithLog().first;
}

}  // namespace sagegate
