#pragma once

#include <boost/asio/ssl/context.hpp>
#include <string>

#include "server_config.hpp"

namespace passgen {

// OpenSSL protocol constant for "1.2" or "1.3".
// @throws std::invalid_argument for any other name.
int tls_protocol_version(const std::string& name);

// Protocol floor, server cipher preference and the TLS 1.2 cipher list. No key material.
void configure_tls_context(boost::asio::ssl::context& ctx, const ServerConfig& config);

/**
 * configure_tls_context, then the certificate chain and private key from the configured paths.
 * @throws boost::system::system_error if either file cannot be loaded.
 */
void load_server_certificate(boost::asio::ssl::context& ctx, const ServerConfig& config);

}
