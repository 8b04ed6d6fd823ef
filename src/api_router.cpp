#include "api_router.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"

namespace passgen {

ApiRouter::ApiRouter(const ServerConfig& config, const Clock& clock)
    : config_(config)
    , deriver_(clock)
    , generate_handler_(config, deriver_)
    , health_handler_(clock)
    , discovery_handler_(config)
{}

bool ApiRouter::is_loopback(const std::string& remote_addr) {
    return remote_addr == "127.0.0.1" || remote_addr == "::1" || remote_addr == "::ffff:127.0.0.1";
}

Response ApiRouter::route(const Request& req, const std::string& remote_addr) {
    Response res;
    try {
        res = dispatch(req, remote_addr);
    } catch (const std::exception& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::INTERNAL_ERROR,
                         remote_addr, std::string("Unhandled exception: ") + e.what());
        res = make_error_response(http::status::internal_server_error, req.version(), "Internal Server Error");
    }

    add_security_headers(res);
    add_cors_headers(req, res);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();

    MetricsRegistry::instance().increment_counter(metric::HTTP_REQUESTS);

    // Path only: the query string can carry the caller's phrase.
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::REQUEST, remote_addr,
                     std::string(req.method_string()) + " " +
                         std::string(target_path(to_std_view(req.target()))) + " " +
                         std::to_string(res.result_int()));
    return res;
}

Response ApiRouter::dispatch(const Request& req, const std::string& remote_addr) {
    const auto path = target_path(to_std_view(req.target()));
    const auto method = req.method();

    if (method == http::verb::options) {
        return handle_cors_preflight(req);
    }

    // --- Routing Table ---
    if (path == "/generate") {
        if (method == http::verb::get) return generate_handler_.handle_get(req, remote_addr);
        if (method == http::verb::post) return generate_handler_.handle_post(req, remote_addr);
        return handle_method_not_allowed(req, "GET, POST, OPTIONS");
    }

    if (path == "/") {
        if (method == http::verb::get) return discovery_handler_.handle_root(req.version());
        return handle_method_not_allowed(req, "GET, OPTIONS");
    }

    if (path == "/health") {
        if (method == http::verb::get) return health_handler_.handle_health(req.version());
        return handle_method_not_allowed(req, "GET, OPTIONS");
    }

    if (path == "/openapi.json") {
        if (method == http::verb::get) return discovery_handler_.handle_openapi(req.version());
        return handle_method_not_allowed(req, "GET, OPTIONS");
    }

    // Metrics are an operator concern; hidden from non-local peers.
    if (path == "/metrics" && is_loopback(remote_addr)) {
        if (method == http::verb::get) return health_handler_.handle_metrics(req.version());
        return handle_method_not_allowed(req, "GET, OPTIONS");
    }

    return handle_not_found(req);
}

Response ApiRouter::handle_cors_preflight(const Request& req) {
    Response res{http::status::no_content, req.version()};
    return res;
}

Response ApiRouter::handle_not_found(const Request& req) {
    return make_error_response(http::status::not_found, req.version(), "Not Found");
}

Response ApiRouter::handle_method_not_allowed(const Request& req, const char* allow) {
    auto res = make_error_response(http::status::method_not_allowed, req.version(), "Method Not Allowed");
    res.set(http::field::allow, allow);
    return res;
}

void ApiRouter::add_security_headers(Response& res) const {
    res.set(http::field::server, "passgen/" + config_.service_version);
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "no-referrer");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
    res.set(http::field::cache_control, "no-store");
    if (config_.enable_tls) {
        res.set("Strict-Transport-Security", "max-age=31536000; includeSubDomains");
    }
}

void ApiRouter::add_cors_headers(const Request& req, Response& res) const {
    std::string origin;
    auto origin_it = req.find(http::field::origin);
    if (origin_it != req.end()) {
        origin = std::string(origin_it->value());
    }

    if (!origin.empty()) {
        for (const auto& allowed : config_.allowed_origins) {
            if (allowed == "*" || allowed == origin) {
                res.set(http::field::access_control_allow_origin, origin);
                res.set(http::field::vary, "Origin");
                break;
            }
        }
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.set(http::field::access_control_max_age, "86400");
}

} // namespace passgen
