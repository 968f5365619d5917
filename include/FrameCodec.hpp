#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include "Connection.hpp"
#include "Protocol.hpp"

/**
 * FrameCodec - Moves whole frames across a Connection
 *
 * Responsibilities:
 * - Write a frame as a single contiguous buffer
 * - Read a frame header, validate tag and length, then accumulate exactly
 *   the announced number of payload bytes
 *
 * readFrame() never hands back a partially populated frame. Every error it
 * reports means the stream is no longer frame-aligned.
 */
class FrameCodec {
public:
    /**
     * Block until one complete frame has been read
     *
     * @param conn Connection to read from
     * @param out Populated only when the result is CodecError::NONE
     * @return CodecError::NONE on success, otherwise the reason the stream died
     */
    static Protocol::CodecError readFrame(Connection& conn, Protocol::Frame& out);

    /**
     * Encode and send one frame
     *
     * @return CodecError::NONE, or IO_FAILURE if the transport refused the bytes
     */
    static Protocol::CodecError writeFrame(Connection& conn, const Protocol::Frame& frame);

    // Convenience wrappers
    static Protocol::CodecError writeStatus(Connection& conn, Protocol::StatusCode code,
                                            const std::string& message);
    static Protocol::CodecError writeCommand(Connection& conn, const std::string& text);

    /**
     * Read the frame that must terminate a command
     *
     * @param out_code Status code carried by the frame
     * @param out_message Human readable message carried by the frame
     * @return OUT_OF_ORDER if a non-STATUS frame arrives, MALFORMED_PAYLOAD
     *         if the status payload cannot be decoded
     */
    static Protocol::CodecError readStatus(Connection& conn, Protocol::StatusCode& out_code,
                                           std::string& out_message);

private:
    FrameCodec() = delete;
};

#endif // FRAME_CODEC_HPP
