#include "router.hpp"
#include "handlers/api_handler.hpp"
#include "handlers/health_handler.hpp"
#include "logger.hpp"

#include <stdexcept>

namespace probe {

void Router::add(http::verb method, const std::string& path, Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Empty handler for " + path);
    }
    auto& methods = routes_[path];
    if (methods.count(method) != 0) {
        throw std::invalid_argument("Duplicate route: " + std::string(http::to_string(method)) + " " + path);
    }
    methods.emplace(method, std::move(handler));
}

size_t Router::route_count() const {
    size_t count = 0;
    for (const auto& entry : routes_) {
        count += entry.second.size();
    }
    return count;
}

std::string Router::allow_header(const std::map<http::verb, Handler>& methods) {
    std::string allow;
    for (const auto& entry : methods) {
        if (!allow.empty()) allow += ", ";
        allow += std::string(http::to_string(entry.first));
        if (entry.first == http::verb::get && methods.count(http::verb::head) == 0) {
            allow += ", HEAD";
        }
    }
    if (methods.count(http::verb::options) == 0) {
        allow += allow.empty() ? "OPTIONS" : ", OPTIONS";
    }
    return allow;
}

Response Router::dispatch(const Request& req, const std::string& remote_addr) const {
    auto target = req.target();
    auto query_pos = target.find('?');
    std::string path(target.data(), query_pos == beast::string_view::npos ? target.size() : query_pos);

    if (Logger::enabled(Logger::Level::DEBUG)) {
        Logger::log(Logger::Level::DEBUG, "http", std::string(req.method_string()) + " " + path, remote_addr);
    }

    Response res;
    auto route_it = routes_.find(path);
    if (route_it == routes_.end()) {
        res = error_response(http::status::not_found, req.version(), "not found");
    } else {
        const auto& methods = route_it->second;
        auto handler_it = methods.find(req.method());

        // HEAD falls back to the GET handler with the body stripped.
        bool head_from_get = false;
        if (handler_it == methods.end() && req.method() == http::verb::head) {
            handler_it = methods.find(http::verb::get);
            head_from_get = handler_it != methods.end();
        }

        if (handler_it != methods.end()) {
            try {
                res = handler_it->second(req, remote_addr);
            } catch (const std::exception& e) {
                Logger::log(Logger::Level::ERROR, "http", "Internal error: " + std::string(e.what()), remote_addr);
                res = error_response(http::status::internal_server_error, req.version(), "internal server error");
            } catch (...) {
                Logger::log(Logger::Level::ERROR, "http", "Internal error: unknown exception", remote_addr);
                res = error_response(http::status::internal_server_error, req.version(), "internal server error");
            }

            if (head_from_get) {
                // Content-Length still describes the GET representation.
                auto length = res.body().size();
                res.body().clear();
                res.content_length(length);
            }
        } else if (req.method() == http::verb::options) {
            res = Response{http::status::ok, req.version()};
            res.set(http::field::allow, allow_header(methods));
            res.prepare_payload();
            add_security_headers(res);
        } else {
            res = error_response(http::status::method_not_allowed, req.version(), "method not allowed");
            res.set(http::field::allow, allow_header(methods));
        }
    }

    if (Logger::enabled(Logger::Level::DEBUG)) {
        Logger::log(Logger::Level::DEBUG, "http", "Response: " + std::to_string(res.result_int()), remote_addr);
    }
    return res;
}

Router make_service_router(const ServerConfig& config) {
    HealthHandler health;
    ApiHandler api(config);
    Router router;

    // Probes & metrics
    router.add(http::verb::get, "/health", [health](const Request& req, const std::string&) {
        return health.handle_health(req);
    });
    router.add(http::verb::get, "/ready", [health](const Request& req, const std::string&) {
        return health.handle_ready(req);
    });
    router.add(http::verb::get, "/metrics", [health](const Request& req, const std::string&) {
        return health.handle_metrics(req);
    });

    // Introspection API
    router.add(http::verb::get, "/api/v1/status", [api](const Request& req, const std::string&) {
        return api.handle_status(req);
    });
    router.add(http::verb::get, "/api/v1/config", [api](const Request& req, const std::string&) {
        return api.handle_config(req);
    });
    router.add(http::verb::post, "/api/v1/echo", [api](const Request& req, const std::string& remote_addr) {
        return api.handle_echo(req, remote_addr);
    });

    return router;
}

} // namespace probe
