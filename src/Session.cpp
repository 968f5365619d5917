#include "Session.hpp"

#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "DirectoryLister.hpp"
#include "FrameCodec.hpp"
#include "PathResolver.hpp"
#include "TransferEngine.hpp"

using Protocol::CodecError;
using Protocol::Frame;
using Protocol::FrameType;
using Protocol::StatusCode;

namespace {

    // Names the client resolves itself only need to be usable as text
    bool isWellFormedName(const std::string& name) {
        return !name.empty() && name.find('\0') == std::string::npos;
    }

} // namespace


Session::Session(Connection& conn, std::filesystem::path root, EventSink& events, int idle_timeout)
    : conn{conn}, root{std::move(root)}, events{events}, idle_timeout{idle_timeout} {}


void Session::run() {
    emit(EventType::SESSION_OPENED, "");
    while (step()) {
    }
    emit(EventType::SESSION_CLOSED, "", 0, StatusCode::OK, close_reason);
}


bool Session::step() {
    if (current_state == SessionState::CLOSED) return false;
    current_state = SessionState::AWAITING_COMMAND;

    // Idle limit applies only while waiting for the next command
    if (idle_timeout > 0 && !conn.setReadTimeout(idle_timeout)) {
        close("could not arm idle timeout");
        return false;
    }

    Frame frame;
    CodecError err = FrameCodec::readFrame(conn, frame);

    if (idle_timeout > 0 && !conn.setReadTimeout(0)) {
        close("could not clear idle timeout");
        return false;
    }

    if (err == CodecError::CONNECTION_CLOSED) {
        close("client disconnected");
        return false;
    }
    if (err == CodecError::TIMED_OUT) {
        close("idle timeout");
        return false;
    }
    if (err != CodecError::NONE) return protocolError(err);

    // Only a command may start an exchange
    if (frame.type != FrameType::COMMAND) return protocolError(CodecError::OUT_OF_ORDER);

    std::string text = frame.text();
    emit(EventType::COMMAND_RECEIVED, text);

    Command command;
    std::string parse_error;
    if (!CommandParser::parse(text, command, parse_error)) {
        return reject(text, StatusCode::BAD_COMMAND, parse_error);
    }

    current_state = SessionState::RESOLVING;
    return std::visit(overloaded{
        [&](const GetCommand& c)  { return handleGet(c, text); },
        [&](const PutCommand& c)  { return handlePut(c, text); },
        [&](const ListCommand& c) { return handleList(c, text); },
    }, command);
}


// ====================================================================================================
// Command Handlers
// ====================================================================================================

bool Session::handleGet(const GetCommand& command, const std::string& text) {
    if (!isWellFormedName(command.destination)) {
        return reject(text, StatusCode::BAD_COMMAND, CommandParser::usage("GET"));
    }

    ResolvedPath source = PathResolver::resolve(command.source, root, true);
    if (!source.valid) {
        return reject(text, PathResolver::toStatus(source.error),
                      fmt::format("'{}': {}", command.source, PathResolver::describe(source.error)));
    }

    current_state = SessionState::TRANSFERRING;
    emit(EventType::TRANSFER_STARTED, text, 0, StatusCode::OK, source.path.string());

    TransferOutcome outcome = TransferEngine::sendFile(conn, source.path);
    if (outcome.protocol_error != CodecError::NONE) return protocolError(outcome.protocol_error);

    if (!outcome.success) {
        // Before any chunk this is a plain failure; midway it also aborts the stream
        emit(EventType::TRANSFER_FAILED, text, outcome.bytes_transferred, outcome.reason, outcome.message);
        return finishCommand(outcome.reason, outcome.message);
    }

    emit(EventType::TRANSFER_COMPLETED, text, outcome.bytes_transferred);
    return finishCommand(StatusCode::OK, outcome.message);
}


bool Session::handlePut(const PutCommand& command, const std::string& text) {
    // The client streams right after its command, so every refusal drains first
    auto refuse = [&](StatusCode code, const std::string& message) {
        TransferOutcome drained = TransferEngine::discardTransfer(conn);
        if (drained.protocol_error != CodecError::NONE) return protocolError(drained.protocol_error);
        return reject(text, code, message);
    };

    if (!isWellFormedName(command.source)) {
        return refuse(StatusCode::BAD_COMMAND, CommandParser::usage("PUT"));
    }

    ResolvedPath destination = PathResolver::resolve(command.destination, root, true);
    if (!destination.valid) {
        return refuse(PathResolver::toStatus(destination.error),
                      fmt::format("'{}': {}", command.destination, PathResolver::describe(destination.error)));
    }

    current_state = SessionState::TRANSFERRING;
    emit(EventType::TRANSFER_STARTED, text, 0, StatusCode::OK, destination.path.string());

    TransferOutcome outcome = TransferEngine::receiveFile(conn, destination.path);
    if (outcome.protocol_error != CodecError::NONE) {
        emit(EventType::TRANSFER_FAILED, text, outcome.bytes_transferred, StatusCode::IO_ERROR,
             Protocol::codecErrorName(outcome.protocol_error));
        return protocolError(outcome.protocol_error);
    }

    if (!outcome.success) {
        StatusCode code = outcome.peer_aborted ? StatusCode::IO_ERROR : outcome.reason;
        std::string message = outcome.peer_aborted
                                  ? fmt::format("Transfer aborted by client: {}", outcome.message)
                                  : outcome.message;
        emit(EventType::TRANSFER_FAILED, text, outcome.bytes_transferred, code, message);
        return finishCommand(code, message);
    }

    emit(EventType::TRANSFER_COMPLETED, text, outcome.bytes_transferred);
    return finishCommand(StatusCode::OK, outcome.message);
}


bool Session::handleList(const ListCommand& command, const std::string& text) {
    if (command.target == ListTarget::CLIENT) {
        return reject(text, StatusCode::BAD_COMMAND, "LS client is answered by the client itself");
    }

    ResolvedPath dir = PathResolver::resolve(".", root, true);
    if (!dir.valid) {
        return reject(text, PathResolver::toStatus(dir.error), PathResolver::describe(dir.error));
    }

    current_state = SessionState::TRANSFERRING;

    std::vector<std::string> entries;
    PathError err = DirectoryLister::list(dir.path, entries);
    if (err != PathError::NONE) {
        StatusCode code = err == PathError::NOT_FOUND ? StatusCode::DIRECTORY_NOT_FOUND
                                                      : PathResolver::toStatus(err);
        return reject(text, code, fmt::format("Server directory {}", PathResolver::describe(err)));
    }

    TransferOutcome outcome = TransferEngine::sendEntries(conn, entries);
    if (outcome.protocol_error != CodecError::NONE) return protocolError(outcome.protocol_error);

    emit(EventType::LISTING_PRODUCED, text, entries.size());
    return finishCommand(StatusCode::OK, outcome.message);
}


// ====================================================================================================
// Replies and State
// ====================================================================================================

bool Session::reject(const std::string& text, StatusCode code, const std::string& message) {
    emit(EventType::COMMAND_REJECTED, text, 0, code, message);
    return finishCommand(code, message);
}


bool Session::finishCommand(StatusCode code, const std::string& message) {
    CodecError err = FrameCodec::writeStatus(conn, code, message);
    if (err != CodecError::NONE) return protocolError(err);

    current_state = SessionState::AWAITING_COMMAND;
    return true;
}


bool Session::protocolError(CodecError error) {
    emit(EventType::PROTOCOL_ERROR, "", 0, StatusCode::OK, Protocol::codecErrorName(error));
    close(Protocol::codecErrorName(error));
    return false;
}


void Session::close(const std::string& reason) {
    current_state = SessionState::CLOSED;
    close_reason = reason;
}


void Session::emit(EventType type, const std::string& command, uint64_t count,
                   StatusCode status, const std::string& detail) {
    events.onEvent(SessionEvent{type, command, count, status, detail, conn.peer()});
}
