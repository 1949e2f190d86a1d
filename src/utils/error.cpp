#include "padlock/error.hpp"
#include <sstream>

namespace padlock {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::OutOfRange: return "Out of range";
        case ErrorCode::UnsupportedOption: return "Unsupported option";

        case ErrorCode::CryptoInitFailed: return "Crypto initialization failed";
        case ErrorCode::AmbiguousInput: return "Ambiguous or missing input";
        case ErrorCode::LengthMismatch: return "Length mismatch";

        case ErrorCode::InvalidFormat: return "Invalid format";
        case ErrorCode::ConfigLoadFailed: return "Config load failed";
        case ErrorCode::ConfigSaveFailed: return "Config save failed";

        default: return "Unknown error code";
    }
}

std::string Error::to_string() const {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(code_) << "] " << message_;
    if (!details_.empty()) {
        oss << " (" << details_ << ")";
    }
    return oss.str();
}

} // namespace padlock
