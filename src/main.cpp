#include <iostream>
#include <cstring>
#include <string>
#include "Config.hpp"
#include "FileClient.hpp"
#include "FileServer.hpp"


int main(int argc, char* argv[]) {
    // Basic Argument Parsing
    if (argc < 2) {
        std::cerr << Config::usage(argv[0]);
        return 1;
    }

    std::string error;

    // Server Mode
    if (strcmp(argv[1], "server") == 0) {
        ServerConfig config;
        if (!Config::parseServerArgs(argc - 2, argv + 2, config, error)) {
            std::cerr << error << "\n" << Config::usage(argv[0]);
            return 1;
        }

        FileServer server(config);
        if (!server.start()) return 1;
    }

    // Client Mode
    else if (strcmp(argv[1], "client") == 0) {
        ClientConfig config;
        if (!Config::parseClientArgs(argc - 2, argv + 2, config, error)) {
            std::cerr << error << "\n" << Config::usage(argv[0]);
            return 1;
        }

        FileClient client(config.host, config.port);
        if (!client.start()) return 1;
    }

    // Invalid Mode
    else {
        std::cerr << "Unknown mode: " << argv[1] << "\n" << Config::usage(argv[0]);
        return 1;
    }

    return 0;
}
