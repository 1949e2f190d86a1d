#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "app/runner.hpp"
#include "app/settings.hpp"
#include "crypto/byte_source.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "padlock/common.hpp"
#include "padlock/error.hpp"

int main(int argc, char** argv) {
    try {
        auto command_line = padlock::app::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        if (command_line.is_err()) {
            std::cerr << command_line.error().to_string() << "\n" << padlock::app::Runner::usage();
            return padlock::app::exit_code::USAGE;
        }
        const auto& cmd = command_line.value();
        if (cmd.show_help) {
            std::cout << padlock::app::Runner::usage();
            return padlock::app::exit_code::OK;
        }
        if (cmd.show_version) {
            std::cout << "padlock " << PADLOCK_VERSION_STRING << std::endl;
            return padlock::app::exit_code::OK;
        }

        // Load configuration (or use defaults if the default file doesn't exist)
        padlock::utils::Config config;
        if (cmd.config_explicit || std::filesystem::exists(cmd.config_path)) {
            config = padlock::utils::Config::load_from_file(cmd.config_path);
        }

        auto settings = padlock::app::Settings::from_config(config);
        if (settings.is_err()) {
            padlock::utils::Logger::init();
            PADLOCK_LOG_ERROR("Invalid configuration in {}: {}", cmd.config_path, settings.error().to_string());
            return padlock::app::exit_code::FAILURE;
        }

        padlock::utils::Logger::init(settings.value().log_level, settings.value().log_to_file);
        PADLOCK_LOG_DEBUG("padlock v{}.{}.{}",
            PADLOCK_VERSION_MAJOR,
            PADLOCK_VERSION_MINOR,
            PADLOCK_VERSION_PATCH
        );

        padlock::app::Runner runner(settings.value(), padlock::crypto::SecureByteSource::system(), std::cout);
        return runner.run(cmd.args);

    } catch (const std::exception& e) {
        PADLOCK_LOG_ERROR("Fatal error: {}", e.what());
        return padlock::app::exit_code::FAILURE;
    }
}
