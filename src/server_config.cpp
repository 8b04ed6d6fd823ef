#include "server_config.hpp"

#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace passgen {

namespace {

// Parses a whole decimal string into [0, max]. std::stoull alone accepts "12abc" and "-1".
uint64_t parse_unsigned(const std::string& name, const std::string& value, uint64_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(name + " must be a non-negative integer, got '" + value + "'");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + " is out of range: " + value);
    }
    if (parsed > max) {
        throw std::invalid_argument(name + " is out of range: " + value);
    }
    return parsed;
}

uint16_t parse_port(const std::string& name, const std::string& value) {
    auto port = parse_unsigned(name, value, std::numeric_limits<uint16_t>::max());
    if (port == 0) {
        throw std::invalid_argument(name + " must be between 1 and 65535");
    }
    return static_cast<uint16_t>(port);
}

bool parse_flag(const std::string& name, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument(name + " must be a boolean (1/0, true/false), got '" + value + "'");
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(' ');
        if (first == std::string::npos) continue;
        auto last = item.find_last_not_of(' ');
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

} // namespace

void ServerConfig::validate() const {
    if (thread_count < 0) {
        throw std::invalid_argument("thread_count cannot be negative");
    }
    if (max_body_size == 0) {
        throw std::invalid_argument("max_body_size must be positive");
    }
    if (max_connections == 0) {
        throw std::invalid_argument("max_connections must be positive");
    }
    if (enable_tls && (cert_path.empty() || key_path.empty())) {
        throw std::invalid_argument("TLS requires cert_path and key_path");
    }
    if (tls_min_version != "1.2" && tls_min_version != "1.3") {
        throw std::invalid_argument("tls_min_version must be 1.2 or 1.3, got '" + tls_min_version + "'");
    }
}

CliResult apply_cli_args(ServerConfig& config, int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-tls" || arg == "-n") {
            config.enable_tls = false;
        } else if (arg == "--tls" || arg == "-t") {
            config.enable_tls = true;
        } else if (arg == "--help" || arg == "-h") {
            return {true, 0};
        } else {
            config.port = parse_port("port", arg);
        }
    }
    return {};
}

void apply_env_overrides(ServerConfig& config) {
    if (const char* e = std::getenv("PASSGEN_PORT")) config.port = parse_port("PASSGEN_PORT", e);
    if (const char* e = std::getenv("PASSGEN_ADDR")) config.address = e;
    if (const char* e = std::getenv("PASSGEN_THREADS")) {
        config.thread_count = static_cast<int>(parse_unsigned("PASSGEN_THREADS", e, 1024));
    }

    if (const char* e = std::getenv("PASSGEN_TLS")) config.enable_tls = parse_flag("PASSGEN_TLS", e);
    if (const char* e = std::getenv("PASSGEN_CERT")) config.cert_path = e;
    if (const char* e = std::getenv("PASSGEN_KEY")) config.key_path = e;
    if (const char* e = std::getenv("PASSGEN_TLS_MIN_VERSION")) config.tls_min_version = e;

    if (const char* e = std::getenv("PASSGEN_DEFAULT_PHRASE")) config.default_phrase = e;

    if (const char* e = std::getenv("PASSGEN_ALLOWED_ORIGINS")) {
        config.allowed_origins = split_list(e);
    }

    if (const char* e = std::getenv("PASSGEN_MAX_BODY")) {
        config.max_body_size = static_cast<size_t>(
            parse_unsigned("PASSGEN_MAX_BODY", e, 1024 * 1024));
    }
    if (const char* e = std::getenv("PASSGEN_MAX_CONNECTIONS")) {
        config.max_connections = static_cast<size_t>(
            parse_unsigned("PASSGEN_MAX_CONNECTIONS", e, std::numeric_limits<uint32_t>::max()));
    }
}

std::string usage(const std::string& program) {
    std::stringstream ss;
    ss << "Usage: " << program << " [port] [options]\n"
       << "Options:\n"
       << "  --tls, -t      Enable TLS (requires PASSGEN_CERT / PASSGEN_KEY)\n"
       << "  --no-tls, -n   Disable TLS (default)\n"
       << "  --help, -h     Show this help\n"
       << "Environment:\n"
       << "  PASSGEN_PORT, PASSGEN_ADDR, PASSGEN_THREADS, PASSGEN_TLS,\n"
       << "  PASSGEN_CERT, PASSGEN_KEY, PASSGEN_TLS_MIN_VERSION, PASSGEN_DEFAULT_PHRASE,\n"
       << "  PASSGEN_ALLOWED_ORIGINS, PASSGEN_MAX_BODY, PASSGEN_MAX_CONNECTIONS\n";
    return ss.str();
}

}
