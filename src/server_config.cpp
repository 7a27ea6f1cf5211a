#include "server_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace probe {

namespace {

// Whole-string integer parse, no trailing garbage.
long long parse_integer(const std::string& name, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(name + " must be an integer, got '" + value + "'");
    }
    return parsed;
}

} // namespace

uint16_t parse_port(const std::string& value) {
    long long port = parse_integer("PORT", value);
    if (port < 1 || port > 65535) {
        throw std::invalid_argument("PORT out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

Logger::Level parse_log_level(const std::string& value) {
    Logger::Level level = Logger::Level::INFO;
    if (!Logger::parse_level(value, level)) {
        throw std::invalid_argument("Unknown LOG_LEVEL: " + value);
    }
    return level;
}

void load_config_from_env(ServerConfig& config) {
    if (const char* env_port = std::getenv("PORT")) {
        config.port = parse_port(env_port);
    }

    if (const char* env_level = std::getenv("LOG_LEVEL")) {
        config.log_level = env_level;
    }
    config.log_threshold = parse_log_level(config.log_level);

    if (const char* env_environment = std::getenv("ENVIRONMENT")) {
        config.environment = env_environment;
    }

    if (const char* env_addr = std::getenv("BIND_ADDRESS")) {
        config.address = env_addr;
    }

    if (const char* env_threads = std::getenv("WORKER_THREADS")) {
        long long threads = parse_integer("WORKER_THREADS", env_threads);
        if (threads < 0 || threads > 1024) {
            throw std::invalid_argument("WORKER_THREADS out of range: " + std::string(env_threads));
        }
        config.thread_count = static_cast<int>(threads);
    }

    if (const char* env_body = std::getenv("MAX_BODY_BYTES")) {
        long long bytes = parse_integer("MAX_BODY_BYTES", env_body);
        if (bytes <= 0) {
            throw std::invalid_argument("MAX_BODY_BYTES must be positive: " + std::string(env_body));
        }
        config.max_body_size = static_cast<size_t>(bytes);
    }
}

} // namespace probe
