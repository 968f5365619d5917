#ifndef SESSION_HPP
#define SESSION_HPP

#include <filesystem>
#include <string>

#include "Command.hpp"
#include "Connection.hpp"
#include "Protocol.hpp"
#include "SessionEvent.hpp"

enum class SessionState {
    AWAITING_COMMAND,
    RESOLVING,
    TRANSFERRING,
    CLOSED
};

/**
 * Session - Server side of one client connection
 *
 * Loop: read one CMD frame, resolve its paths against the root, run the
 * transfer or listing, answer with exactly one terminal STATUS frame, and
 * wait for the next command.
 *
 * Malformed commands and path/transfer failures are answered with a STATUS
 * and the session carries on. Codec errors mean the stream can no longer
 * be trusted; the session closes without answering.
 */
class Session {
public:
    /**
     * @param conn Connection to the client; must outlive the session
     * @param root Server working directory, nothing outside it is served
     * @param events Sink for activity events; must outlive the session
     * @param idle_timeout Seconds to wait for a command before giving up, 0 for no limit
     */
    Session(Connection& conn, std::filesystem::path root, EventSink& events, int idle_timeout = 0);

    /** Serve commands until the client disconnects or the stream breaks */
    void run();

    /**
     * Serve a single command
     *
     * @return false once the session has reached CLOSED
     */
    bool step();

    SessionState state() const { return current_state; }
    const std::string& closeReason() const { return close_reason; }

private:
    Connection& conn;
    std::filesystem::path root;
    EventSink& events;
    int idle_timeout;

    SessionState current_state = SessionState::AWAITING_COMMAND;
    std::string close_reason;

    bool handleGet(const GetCommand& command, const std::string& text);
    bool handlePut(const PutCommand& command, const std::string& text);
    bool handleList(const ListCommand& command, const std::string& text);

    bool reject(const std::string& text, Protocol::StatusCode code, const std::string& message);
    bool finishCommand(Protocol::StatusCode code, const std::string& message);
    bool protocolError(Protocol::CodecError error);
    void close(const std::string& reason);

    void emit(EventType type, const std::string& command, uint64_t count = 0,
              Protocol::StatusCode status = Protocol::StatusCode::OK,
              const std::string& detail = "");
};

#endif // SESSION_HPP
