#pragma once

#include "padlock/common.hpp"

namespace padlock::crypto {

/**
 * Initialize libsodium once per process
 * @throws CryptoException CryptoInitFailed
 */
void ensure_sodium_initialized();

/**
 * Source of cryptographically secure random bytes.
 *
 * Every consumer of entropy takes one of these by reference so tests can
 * substitute a deterministic source. Production code uses system().
 */
class SecureByteSource {
public:
    virtual ~SecureByteSource() = default;

    /**
     * Fill a buffer with random bytes
     * @param buffer Buffer to fill
     * @param size Buffer size
     */
    virtual void fill(byte* buffer, size_t size) = 0;

    /**
     * Generate random bytes
     * @param size Number of bytes to generate
     */
    bytes generate(size_t size);

    /**
     * Draw a single random byte
     */
    byte next_byte();

    /**
     * Process-wide libsodium-backed source. Thread-safe.
     * @throws CryptoException if libsodium cannot be initialized
     */
    static SecureByteSource& system();
};

/**
 * libsodium randombytes_buf
 */
class SodiumByteSource : public SecureByteSource {
public:
    SodiumByteSource();

    void fill(byte* buffer, size_t size) override;
};

} // namespace padlock::crypto
