#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>

// Padlock Version
#define PADLOCK_VERSION_MAJOR 0
#define PADLOCK_VERSION_MINOR 1
#define PADLOCK_VERSION_PATCH 0
#define PADLOCK_VERSION_STRING "0.1.0"

// Constants
namespace padlock {
namespace constants {

// Sampling constants
constexpr int BYTE_SPACE = 256;        // distinct values of one random byte
constexpr int MAX_SAMPLE_RANGE = 256;

// Hashing constants
constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t BLAKE3_HASH_SIZE = 32;
constexpr size_t DIGEST_HEX_LENGTH = 64;

// GUID constants
constexpr size_t GUID_SIZE = 48;
constexpr size_t GUID_HEX_LENGTH = GUID_SIZE * 2;

} // namespace constants
} // namespace padlock

// Core types
namespace padlock {

// Basic types
using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;

// Defined in padlock/error.hpp
template<typename T>
class Result;

// Hex helpers (lowercase output)
std::string bytes_to_hex(const byte* data, size_t len);
std::string bytes_to_hex(const bytes& data);
std::string hash_to_hex(const Hash256& hash);
bool is_hex_string(const std::string& str);

// Parse lowercase or uppercase hex into bytes; include padlock/error.hpp to use the Result
Result<bytes> hex_to_bytes(const std::string& hex);

// UTF-8 text <-> bytes, copied verbatim
bytes text_to_bytes(const std::string& text);
std::string bytes_to_text(const bytes& data);

} // namespace padlock
