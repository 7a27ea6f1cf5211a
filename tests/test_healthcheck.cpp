#include <gtest/gtest.h>
#include "healthcheck.hpp"
#include "loopback_server.hpp"
#include "logger.hpp"

using namespace probe;
using probe::testing_support::LoopbackServer;

class HealthcheckTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::set_level(Logger::Level::CRITICAL); }
    void TearDown() override { Logger::set_level(Logger::Level::INFO); }
};

TEST_F(HealthcheckTest, HealthyService) {
    ServerConfig config;
    LoopbackServer server(config);

    EXPECT_EQ(run_healthcheck("127.0.0.1", server.port(), "/health"), 0);
    EXPECT_EQ(run_healthcheck("127.0.0.1", server.port(), "ready"), 0);
    EXPECT_EQ(run_healthcheck("127.0.0.1", server.port(), ""), 0);
}

TEST_F(HealthcheckTest, NonOkStatusFails) {
    ServerConfig config;
    LoopbackServer server(config);

    EXPECT_EQ(run_healthcheck("127.0.0.1", server.port(), "/nonexistent"), 1);
}

TEST_F(HealthcheckTest, UnreachableFails) {
    unsigned short closed_port = 0;
    {
        ServerConfig config;
        LoopbackServer server(config);
        closed_port = server.port();
    }

    EXPECT_EQ(run_healthcheck("127.0.0.1", closed_port, "/health", std::chrono::milliseconds(500)), 1);
}

TEST_F(HealthcheckTest, InvalidArguments) {
    EXPECT_EQ(run_healthcheck("127.0.0.1", 0, "/health"), 1);
    EXPECT_EQ(run_healthcheck("127.0.0.1", 70000, "/health"), 1);
    EXPECT_EQ(run_healthcheck("not-an-address", 8080, "/health"), 1);
}

TEST_F(HealthcheckTest, HostFollowsBindAddress) {
    EXPECT_EQ(healthcheck_host("0.0.0.0"), "127.0.0.1");
    EXPECT_EQ(healthcheck_host(""), "127.0.0.1");
    EXPECT_EQ(healthcheck_host("::"), "::1");
    EXPECT_EQ(healthcheck_host("10.0.0.7"), "10.0.0.7");
    EXPECT_EQ(healthcheck_host("127.0.0.1"), "127.0.0.1");
}
