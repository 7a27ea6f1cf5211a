#pragma once

#include "handlers/response.hpp"
#include "server_config.hpp"

namespace probe {

// Versioned introspection API under /api/v1.
class ApiHandler {
public:
    explicit ApiHandler(const ServerConfig& config)
        : config_(config) {}

    Response handle_status(const Request& req) const;
    Response handle_config(const Request& req) const;

    /**
     * Echoes the request body back under "data".
     * Any JSON value is accepted; a body that does not parse (or nests deeper
     * than max_json_depth) yields 400 with the parser's message.
     */
    Response handle_echo(const Request& req, const std::string& remote_addr = "") const;

private:
    const ServerConfig& config_;
};

} // namespace probe
