#include "runner.hpp"
#include "crypto/guid.hpp"
#include "crypto/hasher.hpp"
#include "crypto/otp.hpp"
#include "crypto/random.hpp"
#include "utils/logger.hpp"
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace padlock::app {

namespace {
    // Decode a hex command argument, throwing on malformed input
    bytes decode_hex_arg(const std::string& name, const std::string& hex) {
        auto decoded = hex_to_bytes(hex);
        if (decoded.is_err()) {
            throw PadlockException(decoded.error().code(),
                name + ": " + decoded.error().to_string());
        }
        return decoded.value();
    }
}

Result<CommandLine> parse_command_line(const std::vector<std::string>& argv) {
    CommandLine cmd;
    size_t i = 0;
    for (; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.empty() || arg[0] != '-') {
            break;
        }
        if (arg == "--config") {
            if (i + 1 >= argv.size()) {
                return Result<CommandLine>::Err(ErrorCode::InvalidArgument, "--config requires a path");
            }
            cmd.config_path = argv[++i];
            cmd.config_explicit = true;
        } else if (arg == "--help" || arg == "-h") {
            cmd.show_help = true;
        } else if (arg == "--version") {
            cmd.show_version = true;
        } else {
            return Result<CommandLine>::Err(Error(ErrorCode::InvalidArgument, "Unknown option", arg));
        }
    }
    cmd.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i), argv.end());
    return Result<CommandLine>::Ok(std::move(cmd));
}

std::string Runner::usage() {
    std::ostringstream oss;
    oss << "usage: padlock [--config <file>] [--help] [--version] [--] [command] [args...]\n"
        << "\n"
        << "commands:\n"
        << "  demo                                  encrypt and decrypt the demo message (default)\n"
        << "  encrypt <text>                        one-time pad encrypt, prints ciphertext and key as hex\n"
        << "  decrypt <key-hex> <cipher-hex> [buffer|string]\n"
        << "                                        one-time pad decrypt\n"
        << "  hash <text>                           hex digest (sha256 or blake3, see config)\n"
        << "  guid                                  96-character random identifier\n"
        << "  randint <range>                       uniform integer in [0, range), 1 <= range <= 256\n"
        << "  sample                                one random byte\n"
        << "  init-config [path]                    write the current settings as a config file\n"
        << "                                        (default padlock.conf, never overwrites)\n";
    return oss.str();
}

int Runner::run(const std::vector<std::string>& args) {
    const std::string command = args.empty() ? "demo" : args.front();
    const std::vector<std::string> rest(args.empty() ? args.end() : args.begin() + 1, args.end());

    PADLOCK_LOG_DEBUG("Running command '{}' with {} argument(s)", command, rest.size());

    try {
        if (command == "demo") return cmd_demo();
        if (command == "encrypt") return cmd_encrypt(rest);
        if (command == "decrypt") return cmd_decrypt(rest);
        if (command == "hash") return cmd_hash(rest);
        if (command == "guid") return cmd_guid();
        if (command == "randint") return cmd_randint(rest);
        if (command == "sample") return cmd_sample();
        if (command == "init-config") return cmd_init_config(rest);
    } catch (const PadlockException& e) {
        PADLOCK_LOG_ERROR("{} failed: [{}] {}", command, error_code_to_string(e.code()), e.what());
        return exit_code::FAILURE;
    }

    return usage_error("unknown command '" + command + "'");
}

int Runner::usage_error(const std::string& message) {
    PADLOCK_LOG_ERROR("{}", message);
    out_ << usage();
    return exit_code::USAGE;
}

int Runner::cmd_demo() {
    crypto::OtpCipher cipher(source_);

    out_ << "Original message: " << settings_.demo_message << "\n";

    auto otp = cipher.encrypt(settings_.demo_message);
    out_ << "Encrypted (hex): " << bytes_to_hex(otp.ciphertext) << "\n";
    out_ << "Key        (hex): " << bytes_to_hex(otp.key) << "\n";

    auto output = crypto::OtpCipher::decrypt_to_string(otp.key, otp.ciphertext);
    out_ << "Decrypted message: " << output << "\n";

    return exit_code::OK;
}

int Runner::cmd_encrypt(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usage_error("encrypt expects exactly one argument");
    }

    crypto::OtpCipher cipher(source_);
    auto otp = cipher.encrypt(args[0]);
    PADLOCK_LOG_DEBUG("Generated one-time pad key of {} bytes", otp.key.size());

    out_ << "ciphertext: " << bytes_to_hex(otp.ciphertext) << "\n";
    out_ << "key: " << bytes_to_hex(otp.key) << "\n";
    return exit_code::OK;
}

int Runner::cmd_decrypt(const std::vector<std::string>& args) {
    if (args.size() < 2 || args.size() > 3) {
        return usage_error("decrypt expects <key-hex> <cipher-hex> [buffer|string]");
    }

    crypto::DecryptOptions options;
    options.return_type = args.size() == 3 ? crypto::parse_return_type(args[2])
                                           : settings_.return_type;

    const bytes key = decode_hex_arg("key", args[0]);
    const bytes ciphertext = decode_hex_arg("ciphertext", args[1]);

    auto plaintext = crypto::OtpCipher::decrypt(key, ciphertext, options);
    if (auto* text = std::get_if<std::string>(&plaintext)) {
        out_ << *text << "\n";
    } else {
        out_ << bytes_to_hex(std::get<bytes>(plaintext)) << "\n";
    }
    return exit_code::OK;
}

int Runner::cmd_hash(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usage_error("hash expects exactly one argument");
    }

    crypto::Hasher hasher(settings_.hash_algorithm);
    out_ << hasher.hash_text(args[0]) << "\n";
    return exit_code::OK;
}

int Runner::cmd_guid() {
    crypto::GuidGenerator generator(source_);
    out_ << generator.generate() << "\n";
    return exit_code::OK;
}

int Runner::cmd_randint(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return usage_error("randint expects exactly one argument");
    }

    int range = 0;
    try {
        size_t consumed = 0;
        range = std::stoi(args[0], &consumed);
        if (consumed != args[0].size()) {
            return usage_error("randint range must be an integer: " + args[0]);
        }
    } catch (const std::logic_error&) {
        return usage_error("randint range must be an integer: " + args[0]);
    }

    crypto::UniformSampler sampler(source_);
    out_ << sampler.random_int(range) << "\n";
    return exit_code::OK;
}

int Runner::cmd_sample() {
    crypto::UniformSampler sampler(source_);
    out_ << sampler.sample_byte() << "\n";
    return exit_code::OK;
}

int Runner::cmd_init_config(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        return usage_error("init-config expects at most one path");
    }

    const std::string path = args.empty() ? DEFAULT_CONFIG_PATH : args[0];
    if (std::filesystem::exists(path)) {
        PADLOCK_LOG_ERROR("Refusing to overwrite existing config file {}", path);
        return exit_code::FAILURE;
    }

    settings_.to_config().save_to_file(path);
    PADLOCK_LOG_INFO("Wrote config file {}", path);
    out_ << path << "\n";
    return exit_code::OK;
}

} // namespace padlock::app
