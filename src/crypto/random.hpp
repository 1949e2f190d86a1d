#pragma once

#include "padlock/common.hpp"
#include "byte_source.hpp"

namespace padlock::crypto {

/**
 * Uniform integer sampling over single random bytes
 */
class UniformSampler {
public:
    explicit UniformSampler(SecureByteSource& source = SecureByteSource::system())
        : source_(source) {}

    /**
     * Draw one random byte
     * @return Integer in [0, 255]
     */
    int sample_byte();

    /**
     * Generate uniform random integer in [0, range) by rejection sampling.
     *
     * Draws at or above floor(256 / range) * range are discarded so that
     * every residue is equally likely. The loop has no iteration cap.
     *
     * @param range Exclusive upper bound, 1..256
     * @throws PadlockException OutOfRange if range > 256,
     *         InvalidArgument if range <= 0
     */
    int random_int(int range);

private:
    SecureByteSource& source_;
};

} // namespace padlock::crypto
