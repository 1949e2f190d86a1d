#include "hasher.hpp"
#include "byte_source.hpp"
#include "padlock/error.hpp"
#include <blake3.h>
#include <sodium.h>

namespace padlock::crypto {

HashAlgorithm parse_hash_algorithm(const std::string& name) {
    if (name == "sha256") {
        return HashAlgorithm::Sha256;
    }
    if (name == "blake3") {
        return HashAlgorithm::Blake3;
    }
    throw PadlockException(ErrorCode::UnsupportedOption,
        name + " is not a supported hash algorithm");
}

const char* hash_algorithm_to_string(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Sha256: return "sha256";
        case HashAlgorithm::Blake3: return "blake3";
    }
    return "sha256";
}

Hash256 Hasher::digest(const bytes& data) const {
    Hash256 result;
    if (algorithm_ == HashAlgorithm::Blake3) {
        static_assert(BLAKE3_OUT_LEN == constants::BLAKE3_HASH_SIZE, "BLAKE3 digest size");
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, data.data(), data.size());
        blake3_hasher_finalize(&hasher, result.data(), result.size());
        return result;
    }

    ensure_sodium_initialized();
    static_assert(crypto_hash_sha256_BYTES == constants::SHA256_HASH_SIZE,
                  "SHA-256 digest size");
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

std::string Hasher::hash_bytes(const bytes& data) const {
    return hash_to_hex(digest(data));
}

std::string Hasher::hash_text(const std::string& text) const {
    return hash_bytes(text_to_bytes(text));
}

} // namespace padlock::crypto
