#include "padlock/common.hpp"
#include "padlock/error.hpp"
#include <cctype>
#include <sstream>
#include <iomanip>

namespace padlock {

std::string bytes_to_hex(const byte* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string bytes_to_hex(const bytes& data) {
    return bytes_to_hex(data.data(), data.size());
}

std::string hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

bool is_hex_string(const std::string& str) {
    for (char c : str) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

namespace {
    byte hex_nibble(char c) {
        if (c >= '0' && c <= '9') return static_cast<byte>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<byte>(c - 'a' + 10);
        return static_cast<byte>(c - 'A' + 10);
    }
}

Result<bytes> hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return Result<bytes>::Err(Error(ErrorCode::InvalidFormat,
            "Invalid hex string length", std::to_string(hex.length())));
    }
    if (!is_hex_string(hex)) {
        return Result<bytes>::Err(ErrorCode::InvalidFormat,
            "Hex string contains non-hex characters");
    }

    bytes result(hex.length() / 2);
    for (size_t i = 0; i < result.size(); ++i) {
        result[i] = static_cast<byte>((hex_nibble(hex[i * 2]) << 4) | hex_nibble(hex[i * 2 + 1]));
    }
    return Result<bytes>::Ok(std::move(result));
}

bytes text_to_bytes(const std::string& text) {
    return bytes(text.begin(), text.end());
}

std::string bytes_to_text(const bytes& data) {
    return std::string(data.begin(), data.end());
}

} // namespace padlock
