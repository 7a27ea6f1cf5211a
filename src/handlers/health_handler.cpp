#include "handlers/health_handler.hpp"
#include "timestamp.hpp"

namespace probe {

const char* const kMetricsFixture =
R"(# HELP app_requests_total Total application requests
# TYPE app_requests_total counter
app_requests_total{method="GET",path="/health"} 100
app_requests_total{method="GET",path="/ready"} 50
app_requests_total{method="GET",path="/api/v1/status"} 30

# HELP app_request_duration_seconds Request latency
# TYPE app_request_duration_seconds histogram
app_request_duration_seconds_bucket{le="0.1"} 95
app_request_duration_seconds_bucket{le="0.5"} 98
app_request_duration_seconds_bucket{le="1.0"} 100

# HELP app_info Application info
# TYPE app_info gauge
app_info{app="kubernetes-platform-stack",version="1.0.0",environment="unknown"} 1
)";

Response HealthHandler::handle_health(const Request& req) const {
    json::object response;
    response["status"] = "healthy";
    response["timestamp"] = utc_timestamp();
    return json_response(http::status::ok, req.version(), response);
}

Response HealthHandler::handle_ready(const Request& req) const {
    json::object response;
    response["ready"] = true;
    response["timestamp"] = utc_timestamp();
    return json_response(http::status::ok, req.version(), response);
}

Response HealthHandler::handle_metrics(const Request& req) const {
    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "text/plain");
    res.body() = kMetricsFixture;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

} // namespace probe
