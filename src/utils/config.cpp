#include "config.hpp"
#include "padlock/error.hpp"
#include <fstream>

namespace padlock::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigLoadFailed, "Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigLoadFailed,
            "Failed to parse config file " + path + ": " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw ConfigException(ErrorCode::ConfigLoadFailed, "Config file is not a JSON object: " + path);
    }

    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigException(ErrorCode::ConfigLoadFailed,
            "Failed to parse JSON: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw ConfigException(ErrorCode::ConfigLoadFailed, "Config is not a JSON object");
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigException(ErrorCode::ConfigSaveFailed, "Failed to open file for writing: " + path);
    }

    file << data_.dump(2);
}

} // namespace padlock::utils
