#include "settings.hpp"

namespace padlock::app {

namespace {
    const char* const kLogLevels[] = {"trace", "debug", "info", "warn", "error", "critical"};

    bool is_known_log_level(const std::string& level) {
        for (const char* known : kLogLevels) {
            if (level == known) return true;
        }
        return false;
    }

    // Present-but-mistyped keys are errors, missing keys take the default
    template<typename T>
    std::optional<Error> read_typed(const utils::Config& config, const std::string& key, T& out) {
        if (!config.has(key)) {
            return std::nullopt;
        }
        auto value = config.get<T>(key);
        if (!value) {
            return Error(ErrorCode::InvalidFormat, "Config key has the wrong type", key);
        }
        out = *value;
        return std::nullopt;
    }
}

Result<Settings> Settings::from_config(const utils::Config& config) {
    Settings settings;

    std::string hash_name = crypto::hash_algorithm_to_string(settings.hash_algorithm);
    std::string return_name = crypto::return_type_to_string(settings.return_type);

    if (auto err = read_typed(config, "log_level", settings.log_level)) {
        return Result<Settings>::Err(*err);
    }
    if (auto err = read_typed(config, "log_to_file", settings.log_to_file)) {
        return Result<Settings>::Err(*err);
    }
    if (auto err = read_typed(config, "hash_algorithm", hash_name)) {
        return Result<Settings>::Err(*err);
    }
    if (auto err = read_typed(config, "return_type", return_name)) {
        return Result<Settings>::Err(*err);
    }
    if (auto err = read_typed(config, "demo_message", settings.demo_message)) {
        return Result<Settings>::Err(*err);
    }

    if (!is_known_log_level(settings.log_level)) {
        return Result<Settings>::Err(Error(ErrorCode::UnsupportedOption,
            "Unknown log level", settings.log_level));
    }

    try {
        settings.hash_algorithm = crypto::parse_hash_algorithm(hash_name);
        settings.return_type = crypto::parse_return_type(return_name);
    } catch (const PadlockException& e) {
        return Result<Settings>::Err(e.code(), e.what());
    }

    return Result<Settings>::Ok(settings);
}

utils::Config Settings::to_config() const {
    utils::Config config;
    config.set("log_level", log_level);
    config.set("log_to_file", log_to_file);
    config.set("hash_algorithm", std::string(crypto::hash_algorithm_to_string(hash_algorithm)));
    config.set("return_type", std::string(crypto::return_type_to_string(return_type)));
    config.set("demo_message", demo_message);
    return config;
}

} // namespace padlock::app
