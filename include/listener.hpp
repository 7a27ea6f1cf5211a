#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <memory>

#include "server_config.hpp"
#include "router.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace probe {

// Accepts incoming connections and launches a session for each on its own strand.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    // Opens, binds and listens immediately. Throws std::runtime_error on failure.
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        const Router& router
    );

    void run();
    void stop();

    // Port actually bound; differs from the requested one when binding port 0.
    unsigned short local_port() const;

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    const Router& router_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

} // namespace probe
