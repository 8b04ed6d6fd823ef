#pragma once

#include <string>
#include <vector>
#include "server_config.hpp"
#include "handlers/response_builder.hpp"

namespace passgen {

// Static service metadata: the root index and the OpenAPI document.
class DiscoveryHandler {
public:
    explicit DiscoveryHandler(const ServerConfig& config) : config_(config) {}

    // {"message", "endpoints", "author"}
    Response handle_root(unsigned version);

    Response handle_openapi(unsigned version);

    static const std::vector<std::string>& advertised_endpoints();

    // Builds the OpenAPI 3.0 description of the public endpoints.
    json::object build_openapi() const;

private:
    const ServerConfig& config_;
};

} // namespace passgen
