#include "http_session.hpp"
#include "logger.hpp"

#include <chrono>

namespace probe {

HttpSession::HttpSession(
    tcp::socket&& socket,
    const ServerConfig& config,
    const Router& router
)
    : stream_(std::move(socket))
    , config_(config)
    , router_(router)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Starts the asynchronous session activity
void HttpSession::run() {
    do_read();
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    // Bounds slow clients and idle keep-alive connections
    stream_.expires_after(std::chrono::seconds(config_.request_timeout_sec));

    parser_.emplace();
    parser_->body_limit(config_.max_body_size);

    auto self = shared_from_this();
    http::async_read(
        stream_,
        buffer_,
        *parser_,
        [self](beast::error_code ec, std::size_t bytes) {
            self->on_read(ec, bytes);
        });
}

// Handles the completion of an asynchronous read operation
void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }

    if (ec == http::error::body_limit) {
        handle_payload_too_large();
        return;
    }

    if (ec) {
        auto level = (ec == beast::error::timeout || ec == net::error::operation_aborted ||
                      ec == net::error::connection_reset)
            ? Logger::Level::DEBUG
            : Logger::Level::WARNING;
        Logger::log(level, "http", "Read error: " + ec.message(), remote_addr_);
        return;
    }

    handle_request();
}

void HttpSession::handle_request() {
    auto req = parser_->release();

    Response res = router_.dispatch(req, remote_addr_);
    res.keep_alive(req.keep_alive());

    send_response(std::move(res));
}

// The rest of the body is still on the wire, so the connection cannot be reused.
void HttpSession::handle_payload_too_large() {
    Logger::log(Logger::Level::WARNING, "http",
                "Request body exceeds " + std::to_string(config_.max_body_size) + " bytes", remote_addr_);

    Response res = error_response(http::status::payload_too_large, parser_->get().version(), "payload too large");
    res.keep_alive(false);

    send_response(std::move(res));
}

void HttpSession::send_response(Response&& res) {
    auto sp = std::make_shared<Response>(std::move(res));

    auto self = shared_from_this();
    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        Logger::log(Logger::Level::WARNING, "http", "Write error: " + ec.message(), remote_addr_);
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

} // namespace probe
