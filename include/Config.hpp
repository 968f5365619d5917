#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <string>

constexpr int DEFAULT_PORT = 0xDEAD;   // 57005

/**
 * Startup settings for server mode
 */
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int port = DEFAULT_PORT;
    std::filesystem::path root = ".";          // Absolute after parsing
    std::string log_file = "logs/server.log";
    int idle_timeout = 0;                      // Seconds, 0 = wait forever
};

/**
 * Startup settings for client mode
 */
struct ClientConfig {
    std::string host;
    int port = DEFAULT_PORT;
};

/**
 * Config - Command line parsing for both modes
 *
 * argv here starts after the mode word, e.g. for
 * "sfmp server 5000 /srv --idle-timeout 30" args are {"5000", "/srv", "--idle-timeout", "30"}.
 */
class Config {
public:
    /**
     * server [port] [root-dir] [--bind <addr>] [--log-file <path>] [--idle-timeout <seconds>]
     *
     * The root directory must exist; it is stored as an absolute path.
     *
     * @return true on success, otherwise out_error explains the problem
     */
    static bool parseServerArgs(int argc, char* argv[], ServerConfig& out, std::string& out_error);

    /**
     * client <host> <port>
     */
    static bool parseClientArgs(int argc, char* argv[], ClientConfig& out, std::string& out_error);

    static std::string usage(const std::string& program);

private:
    Config() = delete;

    static bool parseWholeInt(const std::string& text, int& out);
    static bool parsePort(const std::string& text, int& out, std::string& out_error);
};

#endif // CONFIG_HPP
