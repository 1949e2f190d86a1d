#pragma once

#include "padlock/common.hpp"
#include <spdlog/fmt/fmt.h>
#include <string>

namespace padlock::crypto {

enum class HashAlgorithm {
    Sha256,
    Blake3
};

/**
 * Parse "sha256" or "blake3"
 * @throws PadlockException UnsupportedOption otherwise
 */
HashAlgorithm parse_hash_algorithm(const std::string& name);

const char* hash_algorithm_to_string(HashAlgorithm algorithm);

/**
 * Hex digest wrapper over SHA-256 (libsodium) or BLAKE3.
 * Both produce 32 bytes, rendered as 64 lowercase hex characters.
 */
class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm = HashAlgorithm::Sha256)
        : algorithm_(algorithm) {}

    HashAlgorithm algorithm() const { return algorithm_; }

    /**
     * Raw 32-byte digest
     */
    Hash256 digest(const bytes& data) const;

    std::string hash_bytes(const bytes& data) const;

    /**
     * Digest of the UTF-8 bytes of a string
     */
    std::string hash_text(const std::string& text) const;

    std::string hash(const std::string& text) const { return hash_text(text); }
    std::string hash(const char* text) const { return hash_text(text); }

    /**
     * Hash any formattable value by its text form, so hash(42) == hash("42")
     */
    template<typename T>
    std::string hash(const T& value) const {
        return hash_text(fmt::to_string(value));
    }

private:
    HashAlgorithm algorithm_;
};

} // namespace padlock::crypto
