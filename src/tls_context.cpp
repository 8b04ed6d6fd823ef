#include "tls_context.hpp"

#include <openssl/ssl.h>

#include <stdexcept>

namespace passgen {

namespace ssl = boost::asio::ssl;

namespace {

// Forward-secret AEAD suites only. TLS 1.3 suites are OpenSSL's defaults.
constexpr const char* kTls12Ciphers =
    "ECDHE-ECDSA-AES256-GCM-SHA384:"
    "ECDHE-RSA-AES256-GCM-SHA384:"
    "ECDHE-ECDSA-CHACHA20-POLY1305:"
    "ECDHE-RSA-CHACHA20-POLY1305:"
    "ECDHE-ECDSA-AES128-GCM-SHA256:"
    "ECDHE-RSA-AES128-GCM-SHA256";

}

int tls_protocol_version(const std::string& name) {
    if (name == "1.2") return TLS1_2_VERSION;
    if (name == "1.3") return TLS1_3_VERSION;
    throw std::invalid_argument("TLS minimum version must be 1.2 or 1.3, got '" + name + "'");
}

void configure_tls_context(ssl::context& ctx, const ServerConfig& config) {
    const int min_version = tls_protocol_version(config.tls_min_version);

    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::single_dh_use
    );

    SSL_CTX* native = ctx.native_handle();
    if (SSL_CTX_set_min_proto_version(native, min_version) != 1) {
        throw std::runtime_error("Failed to set TLS minimum version " + config.tls_min_version);
    }
    SSL_CTX_set_options(native, SSL_OP_CIPHER_SERVER_PREFERENCE);

    if (min_version == TLS1_2_VERSION && SSL_CTX_set_cipher_list(native, kTls12Ciphers) != 1) {
        throw std::runtime_error("No usable TLS 1.2 cipher in the configured list");
    }
}

void load_server_certificate(ssl::context& ctx, const ServerConfig& config) {
    configure_tls_context(ctx, config);
    ctx.use_certificate_chain_file(config.cert_path);
    ctx.use_private_key_file(config.key_path, ssl::context::pem);
}

}
