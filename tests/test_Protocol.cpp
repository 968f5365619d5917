#include <gtest/gtest.h>

#include "Protocol.hpp"

using namespace Protocol;


TEST(ProtocolTest, EncodesHeaderAsTagThenBigEndianLength) {
    std::vector<char> bytes = encode(Frame::command("LS server"));

    ASSERT_EQ(bytes.size(), FRAME_HEADER_SIZE + 9);
    EXPECT_EQ(static_cast<uint8_t>(bytes[0]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(bytes[1]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(bytes[2]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(bytes[3]), 0x00);
    EXPECT_EQ(static_cast<uint8_t>(bytes[4]), 0x09);
    EXPECT_EQ(std::string(bytes.begin() + 5, bytes.end()), "LS server");
}

TEST(ProtocolTest, TagsMatchWireValues) {
    EXPECT_EQ(static_cast<uint8_t>(encode(Frame::command("x"))[0]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(encode(Frame::status(StatusCode::OK, ""))[0]), 0x02);
    EXPECT_EQ(static_cast<uint8_t>(encode(Frame::chunk("ab", 2))[0]), 0x03);
    EXPECT_EQ(static_cast<uint8_t>(encode(Frame::end())[0]), 0x04);
}

TEST(ProtocolTest, EndFrameHasNoPayload) {
    std::vector<char> bytes = encode(Frame::end());
    ASSERT_EQ(bytes.size(), FRAME_HEADER_SIZE);
    EXPECT_EQ(parse_uint32(&bytes[1]), 0u);
}

TEST(ProtocolTest, StatusPayloadStartsWithCode) {
    Frame frame = Frame::status(StatusCode::OUTSIDE_ROOT, "nope");
    ASSERT_EQ(frame.payload.size(), 5u);
    EXPECT_EQ(static_cast<uint8_t>(frame.payload[0]), 5);

    StatusCode code;
    std::string message;
    ASSERT_TRUE(frame.parseStatus(code, message));
    EXPECT_EQ(code, StatusCode::OUTSIDE_ROOT);
    EXPECT_EQ(message, "nope");
}

TEST(ProtocolTest, ParseStatusRejectsEmptyAndUnknownCodes) {
    StatusCode code;
    std::string message;

    Frame empty;
    empty.type = FrameType::STATUS;
    EXPECT_FALSE(empty.parseStatus(code, message));

    Frame unknown;
    unknown.type = FrameType::STATUS;
    unknown.payload = {static_cast<char>(42)};
    EXPECT_FALSE(unknown.parseStatus(code, message));

    EXPECT_FALSE(Frame::chunk("a", 1).parseStatus(code, message));
}

TEST(ProtocolTest, ChunkCarriesArbitraryBytes) {
    const char raw[] = {'\0', '\xff', '\n', 'A'};
    Frame frame = Frame::chunk(raw, sizeof(raw));
    ASSERT_EQ(frame.payload.size(), 4u);
    EXPECT_EQ(frame.payload[0], '\0');
    EXPECT_EQ(frame.payload[1], '\xff');
}

TEST(ProtocolTest, ParseHeaderRejectsUnknownTag) {
    const char header[] = {0x07, 0, 0, 0, 0};
    FrameType type;
    uint32_t length;
    EXPECT_EQ(parseHeader(header, type, length), CodecError::UNKNOWN_FRAME_TYPE);

    const char zero[] = {0x00, 0, 0, 0, 0};
    EXPECT_EQ(parseHeader(zero, type, length), CodecError::UNKNOWN_FRAME_TYPE);
}

TEST(ProtocolTest, ParseHeaderEnforcesPerTypeLimits) {
    FrameType type;
    uint32_t length;

    char chunk[FRAME_HEADER_SIZE] = {0x03};
    write_uint32(&chunk[1], MAX_PAYLOAD_SIZE);
    EXPECT_EQ(parseHeader(chunk, type, length), CodecError::NONE);
    EXPECT_EQ(length, MAX_PAYLOAD_SIZE);

    write_uint32(&chunk[1], MAX_PAYLOAD_SIZE + 1);
    EXPECT_EQ(parseHeader(chunk, type, length), CodecError::OVERSIZED_LENGTH);

    char command[FRAME_HEADER_SIZE] = {0x01};
    write_uint32(&command[1], MAX_COMMAND_SIZE + 1);
    EXPECT_EQ(parseHeader(command, type, length), CodecError::OVERSIZED_LENGTH);

    char end[FRAME_HEADER_SIZE] = {0x04};
    write_uint32(&end[1], 1);
    EXPECT_EQ(parseHeader(end, type, length), CodecError::OVERSIZED_LENGTH);
}

TEST(ProtocolTest, Uint32IsBigEndian) {
    char buffer[4];
    write_uint32(buffer, 0x01020304);
    EXPECT_EQ(buffer[0], 0x01);
    EXPECT_EQ(buffer[1], 0x02);
    EXPECT_EQ(buffer[2], 0x03);
    EXPECT_EQ(buffer[3], 0x04);
    EXPECT_EQ(parse_uint32(buffer), 0x01020304u);
}

TEST(ProtocolTest, StatusCodeNames) {
    EXPECT_STREQ(statusCodeName(StatusCode::OK), "OK");
    EXPECT_STREQ(statusCodeName(StatusCode::BAD_COMMAND), "BAD_COMMAND");
    EXPECT_STREQ(statusCodeName(StatusCode::FILE_NOT_FOUND), "FILE_NOT_FOUND");
    EXPECT_STREQ(statusCodeName(StatusCode::DIRECTORY_NOT_FOUND), "DIRECTORY_NOT_FOUND");
    EXPECT_STREQ(statusCodeName(StatusCode::NOT_A_DIRECTORY), "NOT_A_DIRECTORY");
    EXPECT_STREQ(statusCodeName(StatusCode::OUTSIDE_ROOT), "OUTSIDE_ROOT");
    EXPECT_STREQ(statusCodeName(StatusCode::IO_ERROR), "IO_ERROR");
}
