#ifndef FILE_CLIENT_HPP
#define FILE_CLIENT_HPP

#include "BaseClient.hpp"
#include "ClientCommands.hpp"

#include <filesystem>
#include <string>
#include <vector>

// ANSI Color Codes for Terminal Output
#define RESET "\033[0m"
#define RED "\033[31m"     /* Red */
#define GREEN "\033[32m"   /* Green */
#define MAGENTA "\033[35m" /* Magenta */
#define PRINT_ERROR RED << "[ERROR]" << RESET << " "
#define PRINT_SUCCESSES GREEN << "[SUCCESSES]" << RESET << " "
#define PRINT_PROMPT MAGENTA << "Enter an SFMP command:" << RESET << " "

class FileClient : public BaseClient {
public:
    FileClient(const std::string& server_ip, int server_port);
    ~FileClient() override = default;

protected:
    void makeRequest() override;

private:
    std::filesystem::path working_dir;

    void printResult(const Command& command, const CommandResult& result);
    void printDirectory(const std::string& target, const std::vector<std::string>& entries);
    void printHelp();
};

#endif // FILE_CLIENT_HPP
