#pragma once

#include <string>
#include "server_config.hpp"
#include "password_deriver.hpp"
#include "handlers/response_builder.hpp"

namespace passgen {

// HTTP bindings of PasswordDeriver::derive.
// GET reads `length`/`phrase` from the query string, POST from a JSON body.
// Both reject the same out-of-range length with the same 400 body before derive() runs.
class GenerateHandler {
public:
    GenerateHandler(const ServerConfig& config, const PasswordDeriver& deriver)
        : config_(config), deriver_(deriver) {}

    Response handle_get(const Request& req, const std::string& remote_addr);
    Response handle_post(const Request& req, const std::string& remote_addr);

private:
    const ServerConfig& config_;
    const PasswordDeriver& deriver_;

    Response generate(const GenerationRequest& request, unsigned version, const std::string& remote_addr);
    Response reject(unsigned version, const std::string& detail, const std::string& remote_addr);
};

} // namespace passgen
