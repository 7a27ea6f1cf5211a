#include "healthcheck.hpp"
#include "logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace probe {

std::string healthcheck_host(const std::string& bind_address) {
    if (bind_address.empty() || bind_address == "0.0.0.0") {
        return "127.0.0.1";
    }
    if (bind_address == "::") {
        return "::1";
    }
    return bind_address;
}

int run_healthcheck(const std::string& host, int port, const std::string& endpoint,
                    std::chrono::milliseconds timeout) {
    if (port < 1 || port > 65535) {
        Logger::log(Logger::Level::ERROR, "healthcheck", "Invalid port: " + std::to_string(port));
        return 1;
    }

    std::string target = endpoint.empty() ? "/health" : endpoint;
    if (target[0] != '/') {
        target = "/" + target;
    }

    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec) {
        Logger::log(Logger::Level::ERROR, "healthcheck", "Invalid host " + host + ": " + ec.message());
        return 1;
    }

    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, "probe-healthcheck");
    req.keep_alive(false);

    http::response<http::string_body> res;
    beast::error_code result;

    // One deadline covers connect, write and read.
    stream.expires_after(timeout);
    stream.async_connect(
        tcp::endpoint(address, static_cast<unsigned short>(port)),
        [&](beast::error_code connect_ec) {
            if (connect_ec) {
                result = connect_ec;
                return;
            }
            http::async_write(stream, req, [&](beast::error_code write_ec, std::size_t) {
                if (write_ec) {
                    result = write_ec;
                    return;
                }
                http::async_read(stream, buffer, res, [&](beast::error_code read_ec, std::size_t) {
                    result = read_ec;
                });
            });
        });

    ioc.run();

    beast::error_code close_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, close_ec);

    if (result) {
        Logger::log(Logger::Level::ERROR, "healthcheck", "GET " + target + " failed: " + result.message());
        return 1;
    }

    if (res.result() != http::status::ok) {
        Logger::log(Logger::Level::ERROR, "healthcheck",
                    "GET " + target + " returned " + std::to_string(res.result_int()));
        return 1;
    }

    return 0;
}

} // namespace probe
