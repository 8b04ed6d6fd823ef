#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include <string_view>

namespace passgen {

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline Response make_json_response(http::status status, unsigned version, const json::value& body) {
    Response res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

// Error bodies always have the shape {"detail": "..."}.
inline Response make_error_response(http::status status, unsigned version, const std::string& detail) {
    json::object error;
    error["detail"] = detail;
    return make_json_response(status, version, error);
}

inline std::string_view to_std_view(beast::string_view sv) {
    return std::string_view(sv.data(), sv.size());
}

// Request target without the query string.
inline std::string_view target_path(std::string_view target) {
    auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

inline std::string_view target_query(std::string_view target) {
    auto q = target.find('?');
    return q == std::string_view::npos ? std::string_view() : target.substr(q + 1);
}

}
