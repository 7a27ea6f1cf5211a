#pragma once

#include <functional>
#include <map>
#include <string>
#include <unordered_map>

#include "handlers/response.hpp"
#include "server_config.hpp"

namespace probe {

// Explicit (path, method) -> handler table. Populated once before the listener
// starts and only read afterwards, so dispatch needs no locking.
class Router {
public:
    using Handler = std::function<Response(const Request&, const std::string& remote_addr)>;

    void add(http::verb method, const std::string& path, Handler handler);

    /**
     * Routes a request and always produces a response:
     * 404 for unknown paths, 405 for a known path with an unregistered method,
     * 200 with an Allow header for OPTIONS, and 500 if the handler throws.
     * The query string is ignored for matching.
     */
    Response dispatch(const Request& req, const std::string& remote_addr = "") const;

    size_t route_count() const;

private:
    std::unordered_map<std::string, std::map<http::verb, Handler>> routes_;

    static std::string allow_header(const std::map<http::verb, Handler>& methods);
};

// Builds the table for all service endpoints. config must outlive the router.
Router make_service_router(const ServerConfig& config);

} // namespace probe
