#include "guid.hpp"

namespace padlock::crypto {

std::string GuidGenerator::generate() {
    fixed_bytes<constants::GUID_SIZE> raw;
    source_.fill(raw.data(), raw.size());
    return bytes_to_hex(raw.data(), raw.size());
}

} // namespace padlock::crypto
