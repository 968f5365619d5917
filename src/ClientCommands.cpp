#include "ClientCommands.hpp"

#include <system_error>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "DirectoryLister.hpp"
#include "FrameCodec.hpp"
#include "PathResolver.hpp"
#include "TransferEngine.hpp"

namespace fs = std::filesystem;

using Protocol::CodecError;
using Protocol::StatusCode;

namespace {

    CommandResult localFailure(StatusCode status, std::string message) {
        CommandResult result;
        result.status = status;
        result.message = std::move(message);
        result.local_only = true;
        return result;
    }

    // Refused before any local work; the connection is left untouched
    CommandResult commandTooLong(const std::string& text) {
        return localFailure(StatusCode::BAD_COMMAND,
                            fmt::format("Command is {} bytes; the limit is {}",
                                        text.size(), Protocol::MAX_COMMAND_SIZE));
    }

    CommandResult connectionLost(CodecError error) {
        CommandResult result;
        result.status = StatusCode::IO_ERROR;
        result.message = fmt::format("Connection to server lost: {}", Protocol::codecErrorName(error));
        result.connection_lost = true;
        return result;
    }

} // namespace


ClientCommands::ClientCommands(Connection& conn, fs::path working_dir)
    : conn{conn}, working_dir{std::move(working_dir)} {}


CommandResult ClientCommands::execute(const Command& command) {
    return std::visit(overloaded{
        [&](const GetCommand& c) { return getFile(c); },
        [&](const PutCommand& c) { return putFile(c); },
        [&](const ListCommand& c) {
            return c.target == ListTarget::CLIENT ? listClient() : listServer();
        },
    }, command);
}


CommandResult ClientCommands::getFile(const GetCommand& command) {
    std::string text = CommandParser::toText(command);
    if (text.size() > Protocol::MAX_COMMAND_SIZE) return commandTooLong(text);

    // Resolve and Prepare the Local Destination
    ResolvedPath destination = PathResolver::resolve(command.destination, working_dir, false);
    if (!destination.valid) {
        return localFailure(PathResolver::toStatus(destination.error),
                            fmt::format("'{}': {}", command.destination,
                                        PathResolver::describe(destination.error)));
    }

    fs::path parent = destination.path.parent_path();
    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        fs::create_directories(parent, ec);
        if (ec) {
            return localFailure(StatusCode::DIRECTORY_NOT_FOUND,
                                fmt::format("Cannot create directory '{}': {}", parent.string(), ec.message()));
        }
    }

    // Send the Command
    CodecError err = FrameCodec::writeCommand(conn, text);
    if (err != CodecError::NONE) return connectionLost(err);

    // Receive the File (or the Server's Refusal)
    TransferOutcome outcome = TransferEngine::receiveFile(conn, destination.path);
    if (outcome.protocol_error != CodecError::NONE) return connectionLost(outcome.protocol_error);

    CommandResult result;
    result.bytes = outcome.bytes_transferred;

    if (outcome.peer_aborted) {
        // The server's STATUS replaced END and is the terminal reply
        result.status = outcome.reason;
        result.message = outcome.message;
        return result;
    }

    result = readTerminalStatus(result);
    if (!result.connection_lost && !outcome.success) {
        // Server finished fine but the local write did not
        result.status = outcome.reason;
        result.message = outcome.message;
    }
    return result;
}


CommandResult ClientCommands::putFile(const PutCommand& command) {
    std::string text = CommandParser::toText(command);
    if (text.size() > Protocol::MAX_COMMAND_SIZE) return commandTooLong(text);

    // Source must exist locally before anything goes on the wire
    ResolvedPath source = PathResolver::resolve(command.source, working_dir, false);
    if (!source.valid) {
        return localFailure(PathResolver::toStatus(source.error),
                            fmt::format("'{}': {}", command.source, PathResolver::describe(source.error)));
    }

    std::error_code ec;
    if (!fs::is_regular_file(source.path, ec)) {
        return localFailure(StatusCode::FILE_NOT_FOUND,
                            fmt::format("File at {} does not appear to exist.", source.path.string()));
    }

    // Send the Command, then Stream the File Right Behind It
    CodecError err = FrameCodec::writeCommand(conn, text);
    if (err != CodecError::NONE) return connectionLost(err);

    TransferOutcome outcome = TransferEngine::sendFile(conn, source.path);
    if (outcome.protocol_error != CodecError::NONE) return connectionLost(outcome.protocol_error);

    if (!outcome.success) {
        // No END was sent; a STATUS tells the server the transfer is off
        err = FrameCodec::writeStatus(conn, outcome.reason, outcome.message);
        if (err != CodecError::NONE) return connectionLost(err);
    }

    CommandResult result;
    result.bytes = outcome.bytes_transferred;
    return readTerminalStatus(result);
}


CommandResult ClientCommands::listClient() {
    CommandResult result;
    result.local_only = true;

    PathError err = DirectoryLister::list(working_dir, result.entries);
    if (err != PathError::NONE) {
        result.status = err == PathError::NOT_FOUND ? StatusCode::DIRECTORY_NOT_FOUND
                                                    : PathResolver::toStatus(err);
        result.message = fmt::format("Client directory {}", PathResolver::describe(err));
        return result;
    }

    result.message = fmt::format("{} entries", result.entries.size());
    return result;
}


CommandResult ClientCommands::listServer() {
    CodecError err = FrameCodec::writeCommand(conn, CommandParser::toText(ListCommand{ListTarget::SERVER}));
    if (err != CodecError::NONE) return connectionLost(err);

    CommandResult result;
    TransferOutcome outcome = TransferEngine::receiveEntries(conn, result.entries);
    if (outcome.protocol_error != CodecError::NONE) return connectionLost(outcome.protocol_error);

    if (outcome.peer_aborted) {
        result.status = outcome.reason;
        result.message = outcome.message;
        return result;
    }

    return readTerminalStatus(std::move(result));
}


CommandResult ClientCommands::readTerminalStatus(CommandResult result) {
    StatusCode code;
    std::string message;
    CodecError err = FrameCodec::readStatus(conn, code, message);
    if (err != CodecError::NONE) {
        return connectionLost(err == CodecError::CONNECTION_CLOSED ? CodecError::UNEXPECTED_EOF : err);
    }

    result.status = code;
    result.message = message;
    return result;
}
