#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace passgen {


// Core server configuration and derivation policy.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8000;
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";
    std::string tls_min_version = "1.2";  // "1.2" or "1.3"

    // --- Connection & Resource Management ---
    size_t max_body_size = 16 * 1024;  // 16KB, generate bodies are tiny
    size_t max_connections = 10000;
    int connection_timeout_sec = 30;

    // --- Derivation Policy ---
    std::string default_phrase = "The Tomb of Saint Nicholas";  // Used when the caller omits `phrase`

    // --- Service Metadata (discovery & OpenAPI) ---
    std::string service_name = "Password Generator API";
    std::string service_description = "Generate passwords using SHA256 hashing with timestamp";
    std::string service_version = "1.0.0";
    std::string author = "rohan srivastav";

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {"*"};

    // @throws std::invalid_argument naming the offending field.
    void validate() const;
};

// Outcome of command-line parsing. `exit_code` is set when the process should stop (e.g. --help).
struct CliResult {
    bool should_exit = false;
    int exit_code = 0;
};

CliResult apply_cli_args(ServerConfig& config, int argc, const char* const argv[]);

// Applies PASSGEN_* environment variables on top of `config`.
void apply_env_overrides(ServerConfig& config);

std::string usage(const std::string& program);

}
