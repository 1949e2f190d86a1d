#pragma once

#include "padlock/error.hpp"
#include "crypto/hasher.hpp"
#include "crypto/otp.hpp"
#include "utils/config.hpp"
#include <string>

namespace padlock::app {

/**
 * Validated application settings.
 * Every field has a built-in default used when the config omits it.
 */
struct Settings {
    std::string log_level = "warn";
    bool log_to_file = false;
    crypto::HashAlgorithm hash_algorithm = crypto::HashAlgorithm::Sha256;
    crypto::ReturnType return_type = crypto::ReturnType::Buffer;
    std::string demo_message = "Hello from CLI!";

    /**
     * Read settings from a config, falling back to defaults for missing keys
     * @return UnsupportedOption or InvalidFormat on bad values
     */
    static Result<Settings> from_config(const utils::Config& config);

    /**
     * Config holding every setting; written to disk by the init-config command
     */
    utils::Config to_config() const;
};

} // namespace padlock::app
