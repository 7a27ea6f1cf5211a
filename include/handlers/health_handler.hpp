#pragma once

#include "handlers/response.hpp"

namespace probe {

// Exposition text served by /metrics. Kept verbatim so existing dashboards keep scraping it.
extern const char* const kMetricsFixture;

// Orchestrator-facing endpoints: liveness, readiness and the metrics scrape.
class HealthHandler {
public:
    HealthHandler() = default;

    Response handle_health(const Request& req) const;
    Response handle_ready(const Request& req) const;
    Response handle_metrics(const Request& req) const;
};

} // namespace probe
