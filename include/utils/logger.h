// logger.h - logging setup on top of spdlog
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace sagegate::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory: SAGEGATE_LOG_DIR, else ~/.sagegate/logs.
std::string get_log_dir();

// Today's log file path (sagegate.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// SAGEGATE_LOG_RETENTION_DAYS (1..364), default 7.
int get_retention_days();

// Remove sagegate.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Install the default "sagegate" logger over the given sinks.
// With no sinks, logs go to stderr.
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          std::vector<spdlog::sink_ptr> sinks = {});

// Server mode: stdout (human-readable) + daily JSONL file.
// SAGEGATE_LOG_LEVEL (trace|debug|info|warn|error|critical|off).
void init_from_env();

// One-shot mode: stderr only, so stdout carries nothing but the result.
void init_stderr_from_env();

}  // namespace sagegate::logger
