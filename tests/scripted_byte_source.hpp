#pragma once

#include "crypto/byte_source.hpp"
#include <stdexcept>

namespace padlock::test_support {

/**
 * Replays a fixed byte sequence. Throws once exhausted so a test never
 * silently reads past what it scripted.
 */
class ScriptedByteSource : public crypto::SecureByteSource {
public:
    explicit ScriptedByteSource(bytes script) : script_(std::move(script)) {}

    void fill(byte* buffer, size_t size) override {
        if (position_ + size > script_.size()) {
            throw std::out_of_range("ScriptedByteSource exhausted");
        }
        for (size_t i = 0; i < size; ++i) {
            buffer[i] = script_[position_++];
        }
    }

    size_t consumed() const { return position_; }
    size_t remaining() const { return script_.size() - position_; }

private:
    bytes script_;
    size_t position_ = 0;
};

} // namespace padlock::test_support
