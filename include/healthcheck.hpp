#pragma once

#include <chrono>
#include <string>

namespace probe {

// Address a local health check should dial for a given bind address.
// Wildcard binds ("0.0.0.0", "::") map to the matching loopback address.
std::string healthcheck_host(const std::string& bind_address);

/**
 * Container health-check mode: issues GET <endpoint> to host:port and maps the
 * outcome to a process exit code.
 *
 * A missing leading '/' on endpoint is added; an empty endpoint means "/health".
 *
 * @return 0 if the service answered 200 OK within the timeout, 1 otherwise
 *         (invalid port or host, connection refused, timeout, non-200 status).
 */
int run_healthcheck(const std::string& host, int port, const std::string& endpoint,
                    std::chrono::milliseconds timeout = std::chrono::seconds(3));

} // namespace probe
