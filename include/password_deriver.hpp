#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "clock.hpp"

namespace passgen {

struct GenerationRequest {
    int64_t length = 0;
    std::string phrase;
};

struct GenerationResult {
    std::string password;   // exactly `length` lowercase hex characters
    int64_t timestamp = 0;  // Unix seconds at generation time
    int64_t length = 0;
};

enum class DerivationError {
    LengthOutOfRange,
    LengthExceedsDigest,
    InternalFailure
};

struct DerivationFailure {
    DerivationError code;
    std::string detail;
};

using DerivationResult = std::variant<GenerationResult, DerivationFailure>;

const char* to_string(DerivationError error);


// Time-seeded password derivation: SHA256(phrase + epoch_seconds), truncated to `length` hex chars.
//
// The only entropy is the wall clock, so the output space is one value per second and is fully
// predictable when the phrase is known. The derivation is kept as-is for compatibility with
// existing clients; it must not be used to generate real secrets.
class PasswordDeriver {
public:
    static constexpr int64_t MIN_LENGTH = 1;
    static constexpr int64_t MAX_LENGTH = 64;
    static constexpr size_t DIGEST_HEX_LENGTH = 64;

    explicit PasswordDeriver(const Clock& clock) : clock_(clock) {}

    /**
     * Derives a password from `phrase` and the current clock reading.
     * Never throws: range violations and hashing failures come back as a DerivationFailure.
     * @param phrase Arbitrary bytes, hashed as given (callers pass UTF-8).
     * @param length Number of hex characters to keep, within [MIN_LENGTH, MAX_LENGTH].
     */
    DerivationResult derive(const std::string& phrase, int64_t length) const;

    DerivationResult derive(const GenerationRequest& request) const {
        return derive(request.phrase, request.length);
    }

    static bool is_valid_length(int64_t length) {
        return length >= MIN_LENGTH && length <= MAX_LENGTH;
    }

    static std::string length_range_message();

    /**
     * One-shot SHA-256 of `input`, rendered as 64 lowercase hex characters.
     * @throws std::runtime_error if the OpenSSL digest context cannot be used.
     */
    static std::string sha256_hex(const std::string& input);

    // Keeps the first `length` characters of `digest`; LengthExceedsDigest if it is too short.
    static DerivationResult from_digest(const std::string& digest, int64_t timestamp, int64_t length);

private:
    const Clock& clock_;
};

}
