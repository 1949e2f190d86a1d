#pragma once

#include "padlock/common.hpp"
#include "byte_source.hpp"
#include <optional>
#include <string>
#include <variant>

namespace padlock::crypto {

/**
 * Message handed to OtpCipher::encrypt. Exactly one of text/buffer must be set.
 */
struct EncryptInput {
    std::optional<std::string> text;
    std::optional<bytes> buffer;

    static EncryptInput from_text(std::string text) {
        EncryptInput input;
        input.text = std::move(text);
        return input;
    }

    static EncryptInput from_bytes(bytes buffer) {
        EncryptInput input;
        input.buffer = std::move(buffer);
        return input;
    }
};

/**
 * One-time pad encryption output
 */
struct OtpResult {
    bytes ciphertext;
    bytes key;
};

enum class ReturnType {
    Buffer,
    String
};

/**
 * Decryption options
 */
struct DecryptOptions {
    ReturnType return_type = ReturnType::Buffer;
};

// Decrypted message, bytes for ReturnType::Buffer or UTF-8 text for ReturnType::String
using Plaintext = std::variant<bytes, std::string>;

/**
 * Parse a return type name: "buffer", "string", or "" (omitted, meaning buffer)
 * @throws PadlockException UnsupportedOption for any other value
 */
ReturnType parse_return_type(const std::string& name);

const char* return_type_to_string(ReturnType type);

/**
 * One-time pad cipher.
 * A fresh key of the message length is drawn from the byte source on every
 * encrypt call. Never reusing a key is the caller's responsibility.
 */
class OtpCipher {
public:
    explicit OtpCipher(SecureByteSource& source = SecureByteSource::system())
        : source_(source) {}

    /**
     * Encrypt a message
     * @param input Exactly one of text or buffer
     * @return Ciphertext and key, both the length of the message
     * @throws PadlockException AmbiguousInput if both or neither are set
     */
    OtpResult encrypt(const EncryptInput& input);

    OtpResult encrypt(const std::string& text);
    OtpResult encrypt(const bytes& message);

    /**
     * Decrypt to raw bytes
     * @throws PadlockException LengthMismatch if key and ciphertext differ in length
     */
    static bytes decrypt(const bytes& key, const bytes& ciphertext);

    /**
     * Decrypt to UTF-8 text
     */
    static std::string decrypt_to_string(const bytes& key, const bytes& ciphertext);

    /**
     * Decrypt with explicit options
     */
    static Plaintext decrypt(const bytes& key, const bytes& ciphertext,
                             const DecryptOptions& options);

private:
    SecureByteSource& source_;
};

} // namespace padlock::crypto
