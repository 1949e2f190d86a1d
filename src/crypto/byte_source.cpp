#include "byte_source.hpp"
#include "padlock/error.hpp"
#include <sodium.h>

namespace padlock::crypto {

void ensure_sodium_initialized() {
    // sodium_init is thread-safe and idempotent: 0 on first success, 1 afterwards
    if (sodium_init() < 0) {
        throw CryptoException(ErrorCode::CryptoInitFailed, "Failed to initialize libsodium");
    }
}

bytes SecureByteSource::generate(size_t size) {
    bytes result(size);
    if (size > 0) {
        fill(result.data(), size);
    }
    return result;
}

byte SecureByteSource::next_byte() {
    byte value = 0;
    fill(&value, 1);
    return value;
}

SecureByteSource& SecureByteSource::system() {
    static SodiumByteSource instance;
    return instance;
}

SodiumByteSource::SodiumByteSource() {
    ensure_sodium_initialized();
}

void SodiumByteSource::fill(byte* buffer, size_t size) {
    randombytes_buf(buffer, size);
}

} // namespace padlock::crypto
