#include "command_line.hpp"

namespace probe {

CommandLine parse_command_line(int argc, const char* const argv[], ServerConfig& config) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--healthcheck" || arg == "-c") {
            cli.healthcheck = true;
            if (i + 1 < argc && argv[i + 1][0] == '/') {
                cli.healthcheck_path = argv[++i];
            }
        } else if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
        } else {
            config.port = parse_port(arg);
        }
    }
    return cli;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [port] [options]\n"
           "Options:\n"
           "  --healthcheck, -c [/path]  Probe a running instance (default /health) and exit 0 if healthy.\n"
           "                             Targets BIND_ADDRESS, or loopback when bound to all interfaces.\n"
           "  --help, -h                 Show this help\n"
           "Environment:\n"
           "  PORT, LOG_LEVEL, ENVIRONMENT, BIND_ADDRESS, WORKER_THREADS, MAX_BODY_BYTES\n";
}

} // namespace probe
