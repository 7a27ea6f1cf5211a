#include <gtest/gtest.h>
#include "loopback_server.hpp"
#include "logger.hpp"
#include <atomic>
#include <vector>

using namespace probe;
using probe::testing_support::LoopbackServer;
using probe::testing_support::TestClient;

class HttpSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::CRITICAL);
        config.environment = "integration";
    }

    void TearDown() override {
        Logger::set_level(Logger::Level::INFO);
    }

    ServerConfig config;
};

TEST_F(HttpSessionTest, HealthOverTheWire) {
    LoopbackServer server(config);
    TestClient client(server.port());

    auto res = client.send(http::verb::get, "/health");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(json::parse(res.body()).as_object()["status"].as_string(), "healthy");
}

TEST_F(HttpSessionTest, EchoScenario) {
    LoopbackServer server(config);
    TestClient client(server.port());

    auto res = client.send(http::verb::post, "/api/v1/echo", R"({"message":"test","value":123})");
    ASSERT_EQ(res.result(), http::status::ok);

    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body["message"].as_string(), "echo received");
    EXPECT_EQ(body["data"], json::parse(R"({"message":"test","value":123})"));
    EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(HttpSessionTest, InvalidEchoBody) {
    LoopbackServer server(config);
    TestClient client(server.port());

    auto res = client.send(http::verb::post, "/api/v1/echo", "invalid", "text/plain");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_TRUE(json::parse(res.body()).as_object().contains("error"));
}

TEST_F(HttpSessionTest, KeepAliveServesSequentialRequests) {
    LoopbackServer server(config);
    TestClient client(server.port());

    auto status = client.send(http::verb::get, "/api/v1/status");
    EXPECT_EQ(status.result(), http::status::ok);
    EXPECT_EQ(json::parse(status.body()).as_object()["environment"].as_string(), "integration");

    auto metrics = client.send(http::verb::get, "/metrics");
    EXPECT_EQ(metrics.result(), http::status::ok);
    EXPECT_EQ(metrics[http::field::content_type], "text/plain");
    EXPECT_NE(metrics.body().find("app_requests_total"), std::string::npos);

    auto missing = client.send(http::verb::get, "/nonexistent");
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(missing.body(), R"({"error":"not found"})");
}

TEST_F(HttpSessionTest, OversizedBodyRejected) {
    config.max_body_size = 64;
    LoopbackServer server(config);
    TestClient client(server.port());

    std::string payload = "{\"blob\":\"" + std::string(128, 'x') + "\"}";
    auto res = client.send(http::verb::post, "/api/v1/echo", payload);
    EXPECT_EQ(res.result(), http::status::payload_too_large);
    EXPECT_FALSE(res.keep_alive());
}

TEST_F(HttpSessionTest, ConcurrentClients) {
    config.thread_count = 4;
    LoopbackServer server(config);

    const int num_threads = 8;
    const int requests_per_thread = 25;
    std::atomic<int> ok_count{0};

    auto worker = [&] {
        TestClient client(server.port());
        for (int i = 0; i < requests_per_thread; ++i) {
            auto res = client.send(http::verb::get, i % 2 == 0 ? "/ready" : "/api/v1/config");
            if (res.result() == http::status::ok) {
                ok_count++;
            }
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ok_count.load(), num_threads * requests_per_thread);
}
