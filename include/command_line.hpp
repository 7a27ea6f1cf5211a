#pragma once

#include <string>

#include "server_config.hpp"

namespace probe {

struct CommandLine {
    bool show_help = false;
    bool healthcheck = false;
    std::string healthcheck_path = "/health";
};

/**
 * Parses `[port] [--healthcheck|-c [/path]] [--help|-h]`.
 * A positional port is written to config.port. The argument after
 * --healthcheck is taken as the path only when it starts with '/', so
 * `--healthcheck 9090` still reads 9090 as the port.
 * Throws std::invalid_argument on an unparsable port.
 */
CommandLine parse_command_line(int argc, const char* const argv[], ServerConfig& config);

std::string usage(const std::string& program);

} // namespace probe
