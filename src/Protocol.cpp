#include <bit>
#include <concepts>
#include <cstdint>
#include <cstring>

#include "Protocol.hpp"

namespace Protocol {

    Frame Frame::command(std::string_view text) {
        Frame frame;
        frame.type = FrameType::COMMAND;
        frame.payload.assign(text.begin(), text.end());
        return frame;
    }

    Frame Frame::status(StatusCode code, std::string_view message) {
        Frame frame;
        frame.type = FrameType::STATUS;
        frame.payload.reserve(1 + message.size());
        frame.payload.push_back(static_cast<char>(code));
        frame.payload.insert(frame.payload.end(), message.begin(), message.end());
        return frame;
    }

    Frame Frame::chunk(const char* data, size_t length) {
        Frame frame;
        frame.type = FrameType::CHUNK;
        frame.payload.assign(data, data + length);
        return frame;
    }

    Frame Frame::end() {
        Frame frame;
        frame.type = FrameType::END;
        return frame;
    }

    bool Frame::parseStatus(StatusCode& code, std::string& message) const {
        if (type != FrameType::STATUS || payload.empty()) return false;

        uint8_t raw = static_cast<uint8_t>(payload[0]);
        if (!isKnownStatusCode(raw)) return false;

        code = static_cast<StatusCode>(raw);
        message.assign(payload.begin() + 1, payload.end());
        return true;
    }

    size_t maxPayloadFor(FrameType type) {
        switch (type) {
            case FrameType::COMMAND: return MAX_COMMAND_SIZE;
            case FrameType::STATUS:  return MAX_COMMAND_SIZE;
            case FrameType::CHUNK:   return MAX_PAYLOAD_SIZE;
            case FrameType::END:     return 0;
        }
        return 0;
    }

    bool isKnownFrameType(uint8_t tag) {
        return tag >= static_cast<uint8_t>(FrameType::COMMAND) &&
               tag <= static_cast<uint8_t>(FrameType::END);
    }

    bool isKnownStatusCode(uint8_t code) {
        return code <= static_cast<uint8_t>(StatusCode::IO_ERROR);
    }

    std::vector<char> encode(const Frame& frame) {
        std::vector<char> buffer(FRAME_HEADER_SIZE + frame.payload.size());
        buffer[0] = static_cast<char>(frame.type);
        write_uint32(&buffer[1], static_cast<uint32_t>(frame.payload.size()));
        if (!frame.payload.empty()) {
            std::memcpy(&buffer[FRAME_HEADER_SIZE], frame.payload.data(), frame.payload.size());
        }
        return buffer;
    }

    CodecError parseHeader(const char* header, FrameType& out_type, uint32_t& out_length) {
        uint8_t tag = static_cast<uint8_t>(header[0]);
        if (!isKnownFrameType(tag)) return CodecError::UNKNOWN_FRAME_TYPE;

        out_type = static_cast<FrameType>(tag);
        out_length = parse_uint32(&header[1]);
        if (out_length > maxPayloadFor(out_type)) return CodecError::OVERSIZED_LENGTH;

        return CodecError::NONE;
    }

    const char* statusCodeName(StatusCode code) {
        switch (code) {
            case StatusCode::OK:                  return "OK";
            case StatusCode::BAD_COMMAND:         return "BAD_COMMAND";
            case StatusCode::FILE_NOT_FOUND:      return "FILE_NOT_FOUND";
            case StatusCode::DIRECTORY_NOT_FOUND: return "DIRECTORY_NOT_FOUND";
            case StatusCode::NOT_A_DIRECTORY:     return "NOT_A_DIRECTORY";
            case StatusCode::OUTSIDE_ROOT:        return "OUTSIDE_ROOT";
            case StatusCode::IO_ERROR:            return "IO_ERROR";
        }
        return "UNKNOWN";
    }

    const char* frameTypeName(FrameType type) {
        switch (type) {
            case FrameType::COMMAND: return "CMD";
            case FrameType::STATUS:  return "STATUS";
            case FrameType::CHUNK:   return "CHUNK";
            case FrameType::END:     return "END";
        }
        return "UNKNOWN";
    }

    const char* codecErrorName(CodecError error) {
        switch (error) {
            case CodecError::NONE:               return "none";
            case CodecError::CONNECTION_CLOSED:  return "connection closed";
            case CodecError::UNEXPECTED_EOF:     return "unexpected end of stream";
            case CodecError::UNKNOWN_FRAME_TYPE: return "unknown frame type";
            case CodecError::OVERSIZED_LENGTH:   return "oversized frame length";
            case CodecError::MALFORMED_PAYLOAD:  return "malformed frame payload";
            case CodecError::OUT_OF_ORDER:       return "frame out of order";
            case CodecError::IO_FAILURE:         return "transport failure";
            case CodecError::TIMED_OUT:          return "timed out";
        }
        return "unknown";
    }

    /** reverses the byte order (polyfill for std::byteswap from C++23) */
    template<typename T> requires std::integral<T>
    constexpr T byteswap(T value) noexcept {
        if constexpr (sizeof(T) == 1) {
            return value;
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>((value >> 8) | (value << 8));
        } else if constexpr (sizeof(T) == 4) {
            value = ((value >> 8) & 0x00FF00FF) | ((value << 8) & 0xFF00FF00);
            return (value >> 16) | (value << 16);
        } else if constexpr (sizeof(T) == 8) {
            value = ((value >> 8) & 0x00FF00FF00FF00FF) | ((value << 8) & 0xFF00FF00FF00FF00);
            value = ((value >> 16) & 0x0000FFFF0000FFFF) | ((value << 16) & 0xFFFF0000FFFF0000);
            return (value >> 32) | (value << 32);
        }
    }

    /** Convert an integral value between native and big endian */
    template<typename T> requires std::integral<T>
    constexpr T be_convert(T value) {
        if constexpr (std::endian::native == std::endian::big) {
            return value;
        } else {
            return byteswap(value);
        }
    }

    // Parse a 4-byte big-endian uint from buffer
    uint32_t parse_uint32(const char* data) {
        uint32_t raw;
        std::memcpy(&raw, data, sizeof(raw));
        return be_convert(raw);
    }

    // Write a 4-byte big-endian uint to buffer
    void write_uint32(char* dest, uint32_t value) {
        value = be_convert(value);
        std::memcpy(dest, &value, sizeof(value));
    }

} // namespace Protocol
