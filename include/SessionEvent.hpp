#ifndef SESSION_EVENT_HPP
#define SESSION_EVENT_HPP

#include <cstdint>
#include <string>

#include "Protocol.hpp"

enum class EventType {
    SESSION_OPENED,
    COMMAND_RECEIVED,
    COMMAND_REJECTED,
    TRANSFER_STARTED,
    TRANSFER_COMPLETED,
    TRANSFER_FAILED,
    LISTING_PRODUCED,
    PROTOCOL_ERROR,
    SESSION_CLOSED
};

/**
 * Something a session did that is worth recording
 *
 * count is a byte count for transfers and an entry count for listings.
 * peer names the remote end of the session's connection.
 */
struct SessionEvent {
    EventType type;
    std::string command;
    uint64_t count = 0;
    Protocol::StatusCode status = Protocol::StatusCode::OK;
    std::string detail;
    std::string peer;
};

/**
 * Receives session events; formatting and storage are up to the sink
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const SessionEvent& event) = 0;
};

#endif // SESSION_EVENT_HPP
