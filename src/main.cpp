#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

#include "server_config.hpp"
#include "command_line.hpp"
#include "router.hpp"
#include "listener.hpp"
#include "healthcheck.hpp"
#include "logger.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

int main(int argc, char* argv[]) {
    using probe::Logger;
    try {
        probe::ServerConfig config;

        // --- CLI Argument Parsing ---
        probe::CommandLine cli = probe::parse_command_line(argc, argv, config);
        if (cli.show_help) {
            std::cout << probe::usage(argv[0]);
            return 0;
        }

        // --- Environment Variable Overrides ---
        probe::load_config_from_env(config);

        Logger::set_level(config.log_threshold);

        if (cli.healthcheck) {
            return probe::run_healthcheck(probe::healthcheck_host(config.address), config.port,
                                          cli.healthcheck_path);
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        Logger::log(Logger::Level::INFO, "server",
                    "Starting " + config.app_name + " v" + config.app_version +
                    " on port " + std::to_string(config.port));

        // Read-only from here on; sessions hold references to both.
        const probe::ServerConfig& service_config = config;
        const probe::Router router = probe::make_service_router(service_config);

        net::io_context ioc{config.thread_count};

        auto listener = std::make_shared<probe::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(service_config.address), service_config.port},
            service_config,
            router
        );
        listener->run();

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const& ec, int sig) {
                if (ec) {
                    return;
                }
                Logger::log(Logger::Level::INFO, "server",
                            "Received signal " + std::to_string(sig) + ", shutting down");
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        Logger::log(Logger::Level::INFO, "server", "Server stopped");
        return 0;

    } catch (const std::exception& e) {
        Logger::log(Logger::Level::CRITICAL, "server", std::string("Fatal error: ") + e.what());
        return 1;
    }
}
