#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace sagegate::logger {

namespace {
    constexpr const char* LOG_FILE_BASE = "sagegate.jsonl";
    constexpr const char* DEFAULT_DATA_DIR = ".sagegate";
    constexpr const char* LOG_SUBDIR = "logs";
    constexpr int DEFAULT_RETENTION_DAYS = 7;

    constexpr const char* LOG_DIR_ENV = "SAGEGATE_LOG_DIR";
    constexpr const char* LOG_LEVEL_ENV = "SAGEGATE_LOG_LEVEL";
    constexpr const char* LOG_RETENTION_DAYS_ENV = "SAGEGATE_LOG_RETENTION_DAYS";

    std::string format_date(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d");
        return oss.str();
    }

    std::string get_home_dir() {
        if (const char* home = std::getenv("HOME")) {
            return home;
        }
        return "/tmp";
    }

    std::string level_from_env() {
        if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
            return env;
        }
        return "info";
    }
}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::string get_log_dir() {
    if (const char* env = std::getenv(LOG_DIR_ENV)) {
        if (*env) return env;
    }
    return (fs::path(get_home_dir()) / DEFAULT_DATA_DIR / LOG_SUBDIR).string();
}

std::string get_log_file_path() {
    std::string filename = std::string(LOG_FILE_BASE) + "." + format_date(std::chrono::system_clock::now());
    return (fs::path(get_log_dir()) / filename).string();
}

int get_retention_days() {
    if (const char* env = std::getenv(LOG_RETENTION_DAYS_ENV)) {
        try {
            int days = std::stoi(env);
            if (days > 0 && days < 365) {
                return days;
            }
        } catch (const std::exception&) {
        }
    }
    return DEFAULT_RETENTION_DAYS;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::exists(log_dir, ec)) {
        return;
    }

    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days);
    const std::string cutoff_str = format_date(cutoff);
    const std::string prefix = std::string(LOG_FILE_BASE) + ".";

    for (const auto& entry : fs::directory_iterator(log_dir, ec)) {
        if (!entry.is_regular_file()) continue;

        std::string filename = entry.path().filename().string();
        if (filename.rfind(prefix, 0) != 0) continue;

        // Dates are YYYY-MM-DD, so lexical order is chronological order.
        if (filename.substr(prefix.length()) < cutoff_str) {
            std::error_code rm_ec;
            fs::remove(entry.path(), rm_ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          std::vector<spdlog::sink_ptr> sinks) {
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("sagegate", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env() {
    std::vector<spdlog::sink_ptr> sinks;

    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    stdout_sink->set_pattern("[%Y-%m-%d %T.%e] [%l] %v");
    sinks.push_back(stdout_sink);

    const std::string log_dir = get_log_dir();
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    std::string log_path;
    if (!ec) {
        cleanup_old_logs(log_dir, get_retention_days());
        log_path = get_log_file_path();
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
            file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex&) {
            log_path.clear();
        }
    }

    // Empty pattern keeps the per-sink patterns.
    init(level_from_env(), "", sinks);

    if (log_path.empty()) {
        spdlog::warn("Log directory {} is not writable, logging to stdout only", log_dir);
    } else {
        spdlog::info("Gateway logs initialized: {}", log_path);
    }
}

void init_stderr_from_env() {
    init(level_from_env());
}

}  // namespace sagegate::logger
