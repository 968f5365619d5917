#include "FrameCodec.hpp"

#include <string_view>
#include <utility>
#include <vector>

using Protocol::CodecError;
using Protocol::Frame;
using Protocol::FrameType;


CodecError FrameCodec::readFrame(Connection& conn, Frame& out) {
    char header[Protocol::FRAME_HEADER_SIZE];
    size_t received = 0;

    // Read Frame Header
    if (!conn.readExact(header, sizeof(header), received)) {
        if (received > 0) return CodecError::UNEXPECTED_EOF;
        return conn.readTimedOut() ? CodecError::TIMED_OUT : CodecError::CONNECTION_CLOSED;
    }

    // Validate Tag and Length Before Allocating Anything
    FrameType type;
    uint32_t length = 0;
    CodecError err = Protocol::parseHeader(header, type, length);
    if (err != CodecError::NONE) return err;

    // Accumulate Exactly `length` Payload Bytes
    std::vector<char> payload(length);
    if (length > 0 && !conn.readExact(payload.data(), length, received)) {
        return CodecError::UNEXPECTED_EOF;
    }

    // Status frames must carry a known code
    if (type == FrameType::STATUS) {
        if (payload.empty() || !Protocol::isKnownStatusCode(static_cast<uint8_t>(payload[0]))) {
            return CodecError::MALFORMED_PAYLOAD;
        }
    }

    out.type = type;
    out.payload = std::move(payload);
    return CodecError::NONE;
}


CodecError FrameCodec::writeFrame(Connection& conn, const Frame& frame) {
    std::vector<char> buffer = Protocol::encode(frame);
    if (!conn.writeAll(buffer.data(), buffer.size())) {
        return CodecError::IO_FAILURE;
    }
    return CodecError::NONE;
}


CodecError FrameCodec::writeStatus(Connection& conn, Protocol::StatusCode code,
                                   const std::string& message) {
    // Keep the message inside the STATUS payload bound
    std::string_view text(message);
    if (text.size() > Protocol::MAX_COMMAND_SIZE - 1) {
        text = text.substr(0, Protocol::MAX_COMMAND_SIZE - 1);
    }
    return writeFrame(conn, Frame::status(code, text));
}


CodecError FrameCodec::writeCommand(Connection& conn, const std::string& text) {
    if (text.size() > Protocol::MAX_COMMAND_SIZE) return CodecError::OVERSIZED_LENGTH;
    return writeFrame(conn, Frame::command(text));
}


CodecError FrameCodec::readStatus(Connection& conn, Protocol::StatusCode& out_code,
                                  std::string& out_message) {
    Frame frame;
    CodecError err = readFrame(conn, frame);
    if (err != CodecError::NONE) return err;

    if (frame.type != FrameType::STATUS) return CodecError::OUT_OF_ORDER;
    if (!frame.parseStatus(out_code, out_message)) return CodecError::MALFORMED_PAYLOAD;
    return CodecError::NONE;
}
