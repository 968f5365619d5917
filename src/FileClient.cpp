#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <string>
#include <variant>

#include "FileClient.hpp"
#include "Protocol.hpp"


FileClient::FileClient(const std::string& server_ip, int server_port)
    : BaseClient(server_ip, server_port), working_dir{std::filesystem::current_path()} {}


void FileClient::makeRequest() {
    ClientCommands commands(*connection, working_dir);

    // Main Command-Handling Loop
    std::string input;
    while (true) {
        // Prompt User, Read Input
        std::cout << PRINT_PROMPT;
        if (!std::getline(std::cin, input)) break;

        // Exit Case
        if (input == "quit" || input == "exit") break;

        // Clear terminal
        if (input == "clear") {
            std::cout << "\033c" << std::endl;
            continue;
        }

        if (input == "help") {
            printHelp();
            continue;
        }

        if (std::all_of(input.begin(), input.end(), [](unsigned char c){ return std::isspace(c); })) {
            continue;
        }

        // Parse Command
        Command command;
        std::string error;
        if (!CommandParser::parse(input, command, error)) {
            std::cout << "Please select a valid command.\n" << error << "\n\n";
            continue;
        }

        // Handle Command
        CommandResult result = commands.execute(command);
        printResult(command, result);

        if (result.connection_lost) {
            std::cerr << PRINT_ERROR << "There was a problem communicating with the server.\n";
            break;
        }
    }
}


void FileClient::printResult(const Command& command, const CommandResult& result) {
    if (!result.ok()) {
        std::cerr << PRINT_ERROR << Protocol::statusCodeName(result.status) << ": "
                  << result.message << "\n";
        return;
    }

    std::visit(overloaded{
        [&](const GetCommand& c) {
            std::cout << PRINT_SUCCESSES << "Wrote '" << c.destination << "' ("
                      << result.message << ")\n";
        },
        [&](const PutCommand& c) {
            std::cout << PRINT_SUCCESSES << "Uploaded '" << c.source << "' ("
                      << result.message << ")\n";
        },
        [&](const ListCommand& c) {
            printDirectory(c.target == ListTarget::CLIENT ? "client" : "server", result.entries);
        },
    }, command);
}


void FileClient::printDirectory(const std::string& target, const std::vector<std::string>& entries) {
    std::cout << "\nCurrent files in " << target << "'s directory:\n";
    std::cout << std::string(20, '-') << "\n";
    for (const std::string& name : entries) {
        std::cout << name << "\n";
    }
    std::cout << std::string(20, '-') << "\n\n";
}


void FileClient::printHelp() {
    std::cout << CommandParser::usage("") << "\n"
              << "Other: help, clear, quit\n";
}
