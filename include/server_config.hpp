#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

#include "logger.hpp"

namespace probe {

constexpr const char* kAppName = "kubernetes-platform-stack";
constexpr const char* kAppVersion = "1.0.0";

// Process-wide service configuration. Built once at startup and only read afterwards.
struct ServerConfig {
    // --- Identity ---
    std::string app_name = kAppName;
    std::string app_version = kAppVersion;
    std::string environment = "unknown";

    // --- Network ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Logging ---
    std::string log_level = "INFO";  // reported verbatim by /api/v1/config
    Logger::Level log_threshold = Logger::Level::INFO;  // parsed from log_level

    // --- Request limits ---
    size_t max_body_size = 1024 * 1024;  // 1MB
    size_t max_json_depth = 32;
    int request_timeout_sec = 60;
};

// Applies PORT, LOG_LEVEL, ENVIRONMENT, BIND_ADDRESS, WORKER_THREADS and
// MAX_BODY_BYTES on top of the given config.
// Throws std::invalid_argument on malformed or out-of-range values.
void load_config_from_env(ServerConfig& config);

// Maps a LOG_LEVEL value to a logger threshold. Throws std::invalid_argument if unknown.
Logger::Level parse_log_level(const std::string& value);

// Parses a TCP port (1..65535). Throws std::invalid_argument otherwise.
uint16_t parse_port(const std::string& value);

} // namespace probe
