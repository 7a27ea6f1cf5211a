#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "server_config.hpp"
#include "router.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace probe {

// One plaintext HTTP/1.1 connection. Reads requests in a keep-alive loop and
// answers each one through the router.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        tcp::socket&& socket,
        const ServerConfig& config,
        const Router& router
    );

    ~HttpSession() = default;

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    const Router& router_;

    std::string remote_addr_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    void handle_payload_too_large();
    void send_response(Response&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

} // namespace probe
