#include <gtest/gtest.h>
#include "handlers/health_handler.hpp"
#include <regex>

using namespace probe;

namespace {

Request get(const std::string& target) {
    Request req{http::verb::get, target, 11};
    req.prepare_payload();
    return req;
}

const std::regex kIsoTimestamp(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6})");

} // namespace

TEST(HealthHandlerTest, Health) {
    HealthHandler handler;
    auto res = handler.handle_health(get("/health"));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");

    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body["status"].as_string(), "healthy");
    ASSERT_TRUE(body.contains("timestamp"));
    EXPECT_TRUE(std::regex_match(std::string(body["timestamp"].as_string()), kIsoTimestamp));
}

TEST(HealthHandlerTest, Ready) {
    HealthHandler handler;
    auto res = handler.handle_ready(get("/ready"));

    EXPECT_EQ(res.result(), http::status::ok);
    auto body = json::parse(res.body()).as_object();
    EXPECT_TRUE(body["ready"].as_bool());
    EXPECT_TRUE(body.contains("timestamp"));
}

TEST(HealthHandlerTest, MetricsIsPrometheusText) {
    HealthHandler handler;
    auto res = handler.handle_metrics(get("/metrics"));

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "text/plain");
    EXPECT_NE(res.body().find("app_requests_total"), std::string::npos);
    EXPECT_NE(res.body().find("HELP"), std::string::npos);
    EXPECT_EQ(res.body(), kMetricsFixture);
}

TEST(HealthHandlerTest, MetricsFixtureLines) {
    std::string body(kMetricsFixture);

    EXPECT_EQ(body.rfind("# HELP app_requests_total Total application requests\n", 0), 0u);
    EXPECT_NE(body.find("# TYPE app_request_duration_seconds histogram\n"), std::string::npos);
    EXPECT_NE(body.find("app_request_duration_seconds_bucket{le=\"1.0\"} 100\n"), std::string::npos);
    EXPECT_NE(body.find("app_requests_total{method=\"GET\",path=\"/api/v1/status\"} 30\n\n"), std::string::npos);

    const std::string last = "app_info{app=\"kubernetes-platform-stack\",version=\"1.0.0\",environment=\"unknown\"} 1\n";
    ASSERT_GE(body.size(), last.size());
    EXPECT_EQ(body.substr(body.size() - last.size()), last);
}

TEST(HealthHandlerTest, SecurityHeaders) {
    HealthHandler handler;
    auto res = handler.handle_health(get("/health"));
    EXPECT_EQ(res["X-Content-Type-Options"], "nosniff");
}
