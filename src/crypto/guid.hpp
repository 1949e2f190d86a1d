#pragma once

#include "padlock/common.hpp"
#include "byte_source.hpp"
#include <string>

namespace padlock::crypto {

/**
 * Random identifier: 48 bytes from the source as 96 lowercase hex characters.
 * Uniqueness is probabilistic only.
 */
class GuidGenerator {
public:
    explicit GuidGenerator(SecureByteSource& source = SecureByteSource::system())
        : source_(source) {}

    std::string generate();

private:
    SecureByteSource& source_;
};

} // namespace padlock::crypto
