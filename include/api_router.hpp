#pragma once

#include <string>
#include "server_config.hpp"
#include "clock.hpp"
#include "password_deriver.hpp"
#include "handlers/response_builder.hpp"
#include "handlers/generate_handler.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/discovery_handler.hpp"

namespace passgen {

/**
 * Routing table for the public API.
 * Independent of the socket layer: HttpSession hands it a parsed request and the peer address
 * and writes back whatever it returns. Safe to share across sessions and threads.
 */
class ApiRouter {
public:
    ApiRouter(const ServerConfig& config, const Clock& clock);

    ApiRouter(const ApiRouter&) = delete;
    ApiRouter& operator=(const ApiRouter&) = delete;

    Response route(const Request& req, const std::string& remote_addr);

    static bool is_loopback(const std::string& remote_addr);

private:
    const ServerConfig& config_;
    PasswordDeriver deriver_;

    GenerateHandler generate_handler_;
    HealthHandler health_handler_;
    DiscoveryHandler discovery_handler_;

    Response dispatch(const Request& req, const std::string& remote_addr);

    Response handle_cors_preflight(const Request& req);
    Response handle_not_found(const Request& req);
    Response handle_method_not_allowed(const Request& req, const char* allow);

    void add_security_headers(Response& res) const;
    void add_cors_headers(const Request& req, Response& res) const;
};

} // namespace passgen
