#include "password_deriver.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace passgen {

const char* to_string(DerivationError error) {
    switch (error) {
        case DerivationError::LengthOutOfRange: return "LengthOutOfRange";
        case DerivationError::LengthExceedsDigest: return "LengthExceedsDigest";
        case DerivationError::InternalFailure: return "InternalFailure";
        default: return "Unknown";
    }
}

std::string PasswordDeriver::length_range_message() {
    return "Length must be between " + std::to_string(MIN_LENGTH) + " and " +
           std::to_string(MAX_LENGTH) + " characters";
}

std::string PasswordDeriver::sha256_hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 digest computation failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

DerivationResult PasswordDeriver::from_digest(const std::string& digest, int64_t timestamp, int64_t length) {
    // Unreachable from derive() while MAX_LENGTH == DIGEST_HEX_LENGTH.
    if (length < 0 || static_cast<uint64_t>(length) > digest.size()) {
        return DerivationFailure{
            DerivationError::LengthExceedsDigest,
            "Requested length (" + std::to_string(length) + ") exceeds maximum hash length (" +
                std::to_string(digest.size()) + ")"};
    }
    return GenerationResult{digest.substr(0, static_cast<size_t>(length)), timestamp, length};
}

DerivationResult PasswordDeriver::derive(const std::string& phrase, int64_t length) const {
    if (!is_valid_length(length)) {
        return DerivationFailure{DerivationError::LengthOutOfRange, length_range_message()};
    }

    try {
        const int64_t epoch_time = clock_.now_epoch_seconds();
        return from_digest(sha256_hex(phrase + std::to_string(epoch_time)), epoch_time, length);
    } catch (const std::exception& e) {
        return DerivationFailure{DerivationError::InternalFailure,
                                 std::string("Error generating password: ") + e.what()};
    }
}

}
