#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace probe {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

template<class Body>
void add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "probe-server/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Content-Security-Policy", "default-src 'none'");
}

inline Response json_response(http::status status, unsigned version, const json::object& body) {
    Response res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    add_security_headers(res);
    return res;
}

inline Response error_response(http::status status, unsigned version, const std::string& message) {
    json::object body;
    body["error"] = message;
    return json_response(status, version, body);
}

} // namespace probe
