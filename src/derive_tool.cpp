#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include "password_deriver.hpp"
#include "input_validator.hpp"
#include "server_config.hpp"

using namespace passgen;

// Offline derivation, same algorithm as the server. With --timestamp it reproduces any
// previously issued password, which is the reason it must never be treated as a secret.
int main(int argc, char* argv[]) {
    ServerConfig defaults;
    std::string phrase = defaults.default_phrase;
    int64_t length = 16;
    std::unique_ptr<Clock> clock = std::make_unique<SystemClock>();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--length" || arg == "-l") && i + 1 < argc) {
            auto parsed = InputValidator::parse_int64(argv[++i]);
            if (!parsed) {
                std::cerr << "[-] --length must be an integer\n";
                return 2;
            }
            length = *parsed;
        } else if ((arg == "--phrase" || arg == "-p") && i + 1 < argc) {
            phrase = argv[++i];
        } else if ((arg == "--timestamp" || arg == "-t") && i + 1 < argc) {
            auto parsed = InputValidator::parse_int64(argv[++i]);
            if (!parsed) {
                std::cerr << "[-] --timestamp must be an integer (Unix seconds)\n";
                return 2;
            }
            clock = std::make_unique<FixedClock>(*parsed);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [--length N] [--phrase TEXT] [--timestamp EPOCH]\n";
            return 0;
        } else {
            std::cerr << "[-] Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    PasswordDeriver deriver(*clock);
    auto result = deriver.derive(phrase, length);

    if (auto* failure = std::get_if<DerivationFailure>(&result)) {
        std::cerr << "[-] " << to_string(failure->code) << ": " << failure->detail << "\n";
        return 1;
    }

    const auto& generated = std::get<GenerationResult>(result);
    std::cout << "[*] Timestamp: " << generated.timestamp << "\n";
    std::cout << "[*] Length:    " << generated.length << "\n";
    std::cout << "[+] Password:  " << generated.password << "\n";
    return 0;
}
