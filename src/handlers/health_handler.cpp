#include "handlers/health_handler.hpp"

namespace passgen {

Response HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["timestamp"] = clock_.now_epoch_seconds();

    return make_json_response(http::status::ok, version, response);
}

Response HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();

    Response res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    return res;
}

} // namespace passgen
