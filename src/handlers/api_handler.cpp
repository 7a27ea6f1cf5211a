#include "handlers/api_handler.hpp"
#include "logger.hpp"
#include "timestamp.hpp"

namespace probe {

namespace {

constexpr std::size_t kMaxLoggedPayload = 512;

} // namespace

Response ApiHandler::handle_status(const Request& req) const {
    json::object response;
    response["app"] = config_.app_name;
    response["version"] = config_.app_version;
    response["environment"] = config_.environment;
    response["timestamp"] = utc_timestamp();
    return json_response(http::status::ok, req.version(), response);
}

Response ApiHandler::handle_config(const Request& req) const {
    json::object response;
    response["app"] = config_.app_name;
    response["version"] = config_.app_version;
    response["environment"] = config_.environment;
    response["port"] = static_cast<std::int64_t>(config_.port);
    response["log_level"] = config_.log_level;
    response["timestamp"] = utc_timestamp();
    return json_response(http::status::ok, req.version(), response);
}

Response ApiHandler::handle_echo(const Request& req, const std::string& remote_addr) const {
    json::parse_options opt;
    opt.max_depth = config_.max_json_depth;

    json::error_code ec;
    json::value data = json::parse(req.body(), ec, {}, opt);
    if (ec) {
        Logger::log(Logger::Level::ERROR, "echo", "Error in echo endpoint: " + ec.message(), remote_addr);
        return error_response(http::status::bad_request, req.version(),
                              "Failed to decode JSON object: " + ec.message());
    }

    if (Logger::enabled(Logger::Level::INFO)) {
        std::string payload = json::serialize(data);
        if (payload.size() > kMaxLoggedPayload) {
            payload.resize(kMaxLoggedPayload);
            payload += "...";
        }
        Logger::log(Logger::Level::INFO, "echo", "Echo request received: " + payload, remote_addr);
    }

    json::object response;
    response["message"] = "echo received";
    response["data"] = std::move(data);
    response["timestamp"] = utc_timestamp();
    return json_response(http::status::ok, req.version(), response);
}

} // namespace probe
