#include "otp.hpp"
#include "padlock/error.hpp"

namespace padlock::crypto {

namespace {
    bytes xor_bytes(const bytes& a, const bytes& b) {
        bytes out(a.size());
        for (size_t i = 0; i < a.size(); ++i) {
            out[i] = static_cast<byte>(a[i] ^ b[i]);
        }
        return out;
    }
}

ReturnType parse_return_type(const std::string& name) {
    if (name.empty() || name == "buffer") {
        return ReturnType::Buffer;
    }
    if (name == "string") {
        return ReturnType::String;
    }
    throw PadlockException(ErrorCode::UnsupportedOption,
        name + " is not supported as a return type");
}

const char* return_type_to_string(ReturnType type) {
    switch (type) {
        case ReturnType::Buffer: return "buffer";
        case ReturnType::String: return "string";
    }
    return "buffer";
}

OtpResult OtpCipher::encrypt(const EncryptInput& input) {
    if (input.text.has_value() == input.buffer.has_value()) {
        throw PadlockException(ErrorCode::AmbiguousInput,
            "Either text or buffer should be specified, but not both");
    }

    const bytes message = input.text ? text_to_bytes(*input.text) : *input.buffer;

    OtpResult result;
    result.key = source_.generate(message.size());
    result.ciphertext = xor_bytes(message, result.key);
    return result;
}

OtpResult OtpCipher::encrypt(const std::string& text) {
    return encrypt(EncryptInput::from_text(text));
}

OtpResult OtpCipher::encrypt(const bytes& message) {
    return encrypt(EncryptInput::from_bytes(message));
}

bytes OtpCipher::decrypt(const bytes& key, const bytes& ciphertext) {
    if (key.size() != ciphertext.size()) {
        throw PadlockException(ErrorCode::LengthMismatch,
            "The length of the key must match the length of the ciphertext ("
            + std::to_string(key.size()) + " != " + std::to_string(ciphertext.size()) + ")");
    }
    return xor_bytes(key, ciphertext);
}

std::string OtpCipher::decrypt_to_string(const bytes& key, const bytes& ciphertext) {
    return bytes_to_text(decrypt(key, ciphertext));
}

Plaintext OtpCipher::decrypt(const bytes& key, const bytes& ciphertext,
                             const DecryptOptions& options) {
    bytes plaintext = decrypt(key, ciphertext);
    if (options.return_type == ReturnType::String) {
        return bytes_to_text(plaintext);
    }
    return plaintext;
}

} // namespace padlock::crypto
