#pragma once

#include "settings.hpp"
#include "crypto/byte_source.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace padlock::app {

namespace exit_code {
constexpr int OK = 0;
constexpr int FAILURE = 1;
constexpr int USAGE = 2;
} // namespace exit_code

constexpr const char* DEFAULT_CONFIG_PATH = "padlock.conf";

/**
 * Parsed process arguments.
 * Options are only recognised before the first positional argument or "--",
 * so "padlock encrypt -h" encrypts the text "-h".
 */
struct CommandLine {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool config_explicit = false;
    bool show_help = false;
    bool show_version = false;
    std::vector<std::string> args;
};

/**
 * @param argv Arguments without the program name
 * @return InvalidArgument for --config without a path or an unknown option
 */
Result<CommandLine> parse_command_line(const std::vector<std::string>& argv);

/**
 * Executes one padlock command and writes its output to a stream.
 *
 * Commands: demo (default), encrypt, decrypt, hash, guid, randint, sample,
 * init-config.
 * Library errors are logged and turned into exit_code::FAILURE.
 */
class Runner {
public:
    Runner(Settings settings, crypto::SecureByteSource& source, std::ostream& out)
        : settings_(std::move(settings)), source_(source), out_(out) {}

    int run(const std::vector<std::string>& args);

    static std::string usage();

private:
    int cmd_demo();
    int cmd_encrypt(const std::vector<std::string>& args);
    int cmd_decrypt(const std::vector<std::string>& args);
    int cmd_hash(const std::vector<std::string>& args);
    int cmd_guid();
    int cmd_randint(const std::vector<std::string>& args);
    int cmd_sample();
    int cmd_init_config(const std::vector<std::string>& args);

    int usage_error(const std::string& message);

    Settings settings_;
    crypto::SecureByteSource& source_;
    std::ostream& out_;
};

} // namespace padlock::app
