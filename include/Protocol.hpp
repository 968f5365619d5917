#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace Protocol {

    // Wire layout: [1 byte tag][4 bytes big-endian length][length bytes payload]
    enum class FrameType : uint8_t {
        COMMAND = 0x01,
        STATUS  = 0x02,
        CHUNK   = 0x03,
        END     = 0x04
    };

    enum class StatusCode : uint8_t {
        OK                  = 0,
        BAD_COMMAND         = 1,
        FILE_NOT_FOUND      = 2,
        DIRECTORY_NOT_FOUND = 3,
        NOT_A_DIRECTORY     = 4,
        OUTSIDE_ROOT        = 5,
        IO_ERROR            = 6
    };

    // Any of these leaves the stream unaligned, so the connection must be dropped
    enum class CodecError : uint8_t {
        NONE = 0,
        CONNECTION_CLOSED,   // Clean EOF on a frame boundary
        UNEXPECTED_EOF,      // EOF inside a frame
        UNKNOWN_FRAME_TYPE,
        OVERSIZED_LENGTH,
        MALFORMED_PAYLOAD,
        OUT_OF_ORDER,
        IO_FAILURE,
        TIMED_OUT            // Read timeout expired before a frame started
    };

    constexpr size_t FRAME_HEADER_SIZE = 5;
    constexpr size_t CHUNK_SIZE = 16 * 1024;          // Bytes per outgoing CHUNK
    constexpr size_t MAX_PAYLOAD_SIZE = 64 * 1024;    // Largest payload accepted
    constexpr size_t MAX_COMMAND_SIZE = 4 * 1024;

    struct Frame {
        FrameType type = FrameType::END;
        std::vector<char> payload;

        static Frame command(std::string_view text);
        static Frame status(StatusCode code, std::string_view message);
        static Frame chunk(const char* data, size_t length);
        static Frame end();

        // STATUS accessors, only meaningful after parseStatus() succeeded
        bool parseStatus(StatusCode& code, std::string& message) const;

        std::string text() const { return std::string(payload.begin(), payload.end()); }
    };

    /** Largest payload a frame of this type may carry */
    size_t maxPayloadFor(FrameType type);

    bool isKnownFrameType(uint8_t tag);
    bool isKnownStatusCode(uint8_t code);

    /** Serialize a frame (header + payload) */
    std::vector<char> encode(const Frame& frame);

    /** Parse a frame header; out_length is the payload length that follows */
    CodecError parseHeader(const char* header, FrameType& out_type, uint32_t& out_length);

    // Wire names (e.g. "FILE_NOT_FOUND")
    const char* statusCodeName(StatusCode code);
    const char* frameTypeName(FrameType type);
    const char* codecErrorName(CodecError error);

    // Integer Parsing / Writing (big endian)
    uint32_t parse_uint32(const char* data);
    void write_uint32(char* dest, uint32_t value);

} // namespace Protocol

#endif // PROTOCOL_HPP
