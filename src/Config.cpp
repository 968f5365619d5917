#include "Config.hpp"

#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace fs = std::filesystem;


bool Config::parseWholeInt(const std::string& text, int& out) {
    size_t used = 0;
    try {
        out = std::stoi(text, &used);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    // Trailing characters ("80a", "30s") make the whole value invalid
    return used == text.size();
}


bool Config::parsePort(const std::string& text, int& out, std::string& out_error) {
    int port;
    if (!parseWholeInt(text, port) || port < 0 || port > 65535) {
        out_error = fmt::format("Invalid port number: {}", text);
        return false;
    }
    out = port;
    return true;
}


bool Config::parseServerArgs(int argc, char* argv[], ServerConfig& out, std::string& out_error) {
    ServerConfig config;
    int positional = 0;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];

        // Options Taking a Value
        if (arg == "--bind" || arg == "--log-file" || arg == "--idle-timeout") {
            if (i + 1 >= argc) {
                out_error = fmt::format("Missing value for {}", arg);
                return false;
            }
            std::string value = argv[++i];

            if (arg == "--bind") {
                config.bind_address = value;
            } else if (arg == "--log-file") {
                config.log_file = value;
            } else {
                if (!parseWholeInt(value, config.idle_timeout) || config.idle_timeout < 0) {
                    out_error = fmt::format("Invalid idle timeout: {}", value);
                    return false;
                }
            }
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            out_error = fmt::format("Unknown option: {}", arg);
            return false;
        }

        // Positional: <port> [root-dir]
        if (positional == 0) {
            if (!parsePort(arg, config.port, out_error)) return false;
        } else if (positional == 1) {
            config.root = arg;
        } else {
            out_error = fmt::format("Unexpected argument: {}", arg);
            return false;
        }
        ++positional;
    }

    // Validate the Root Directory
    std::error_code ec;
    if (!fs::is_directory(config.root, ec)) {
        out_error = fmt::format("Root directory '{}' does not exist", config.root.string());
        return false;
    }
    fs::path absolute = fs::absolute(config.root, ec);
    if (ec) {
        out_error = fmt::format("Cannot resolve root directory '{}': {}", config.root.string(), ec.message());
        return false;
    }
    config.root = absolute.lexically_normal();

    out = config;
    return true;
}


bool Config::parseClientArgs(int argc, char* argv[], ClientConfig& out, std::string& out_error) {
    if (argc != 2) {
        out_error = "Expected <host> <port>";
        return false;
    }

    ClientConfig config;
    config.host = argv[0];
    if (!parsePort(argv[1], config.port, out_error)) return false;

    out = config;
    return true;
}


std::string Config::usage(const std::string& program) {
    return fmt::format(
        "Usage:\n"
        "  {0} server [port] [root-dir] [--bind <addr>] [--log-file <path>] [--idle-timeout <seconds>]\n"
        "  {0} client <host> <port>\n",
        program);
}
