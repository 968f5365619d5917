#ifndef CLIENT_COMMANDS_HPP
#define CLIENT_COMMANDS_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "Command.hpp"
#include "Connection.hpp"
#include "Protocol.hpp"

/**
 * What the user is told after a command
 */
struct CommandResult {
    Protocol::StatusCode status = Protocol::StatusCode::OK;
    std::string message;                // Server message verbatim, or a local one
    uint64_t bytes = 0;
    std::vector<std::string> entries;   // LS only
    bool local_only = false;            // Answered without contacting the server
    bool connection_lost = false;       // Stream broke; the client must disconnect

    bool ok() const { return status == Protocol::StatusCode::OK && !connection_lost; }
};

/**
 * ClientCommands - Client half of every command
 *
 * Local paths are resolved against the client's working directory with no
 * confinement. Anything that can be decided locally (missing PUT source,
 * LS client, unusable local path) is answered without sending a frame.
 */
class ClientCommands {
public:
    ClientCommands(Connection& conn, std::filesystem::path working_dir);

    CommandResult execute(const Command& command);

    CommandResult getFile(const GetCommand& command);
    CommandResult putFile(const PutCommand& command);
    CommandResult listClient();
    CommandResult listServer();

private:
    Connection& conn;
    std::filesystem::path working_dir;

    CommandResult readTerminalStatus(CommandResult result);
};

#endif // CLIENT_COMMANDS_HPP
