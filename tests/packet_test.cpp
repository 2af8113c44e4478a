#include "tftpd/packet.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace tftpd;

namespace {

std::vector<char> bytes(const std::string &text) {
  return std::vector<char>(text.begin(), text.end());
}

ParsedRequest parse(const std::vector<char> &packet) {
  return parse_request_packet(packet.data(), packet.size());
}

} // namespace

// ======================================================================
// Encoding
// ======================================================================

TEST(PacketEncode, RequestLayout) {
  std::vector<char> rrq = create_rrq_packet("a.txt");
  EXPECT_EQ(bytes(std::string("\x00\x01" "a.txt\0octet\0", 14)), rrq);

  std::vector<char> wrq = create_wrq_packet("b.png", "OCTET");
  EXPECT_EQ(bytes(std::string("\x00\x02" "b.png\0OCTET\0", 14)), wrq);
}

TEST(PacketEncode, DataBlockIsBigEndian) {
  const char payload[] = {'x', 'y', 'z'};
  std::vector<char> packet = create_data_packet(0x0102, payload, sizeof(payload));
  ASSERT_EQ(7U, packet.size());
  EXPECT_EQ(0x00, packet[0]);
  EXPECT_EQ(0x03, packet[1]);
  EXPECT_EQ(0x01, packet[2]);
  EXPECT_EQ(0x02, packet[3]);
  EXPECT_EQ('x', packet[4]);
  EXPECT_EQ('z', packet[6]);
}

TEST(PacketEncode, EmptyDataBlockIsHeaderOnly) {
  std::vector<char> packet = create_data_packet(9, nullptr, 0);
  EXPECT_EQ(DATA_HEADER_SIZE, packet.size());
}

TEST(PacketEncode, DataPayloadLimit) {
  std::vector<char> full(MAX_DATA_SIZE, 'a');
  EXPECT_EQ(MAX_PACKET_SIZE, create_data_packet(1, full.data(), full.size()).size());

  std::vector<char> oversized(MAX_DATA_SIZE + 1, 'a');
  EXPECT_THROW(create_data_packet(1, oversized.data(), oversized.size()),
               std::length_error);
}

TEST(PacketEncode, AckLayout) {
  EXPECT_EQ(bytes(std::string("\x00\x04\xff\xfe", 4)), create_ack_packet(0xfffe));
}

TEST(PacketEncode, ErrorLayout) {
  std::vector<char> packet = create_error_packet(6, "File already exists");
  EXPECT_EQ(bytes(std::string("\x00\x05\x00\x06" "File already exists\0", 24)),
            packet);
}

// ======================================================================
// Request parsing
// ======================================================================

TEST(RequestParse, ReadRequest) {
  ParsedRequest request = parse(create_rrq_packet("report.pdf"));
  ASSERT_TRUE(request.ok());
  EXPECT_TRUE(request.is_read());
  EXPECT_FALSE(request.is_write());
  EXPECT_EQ("report.pdf", request.filename);
  EXPECT_EQ("octet", request.mode);
}

TEST(RequestParse, ModeIsCaseInsensitive) {
  ParsedRequest request = parse(create_wrq_packet("notes.txt", "OcTeT"));
  ASSERT_TRUE(request.ok());
  EXPECT_TRUE(request.is_write());
  EXPECT_EQ("OcTeT", request.mode);
}

TEST(RequestParse, NetasciiIsRejected) {
  ParsedRequest request = parse(create_rrq_packet("notes.txt", "netascii"));
  EXPECT_EQ(RequestStatus::InvalidMode, request.status);
  EXPECT_FALSE(request.is_read());
}

TEST(RequestParse, OtherOpcodesAreInvalid) {
  std::vector<char> ack = create_ack_packet(1);
  EXPECT_EQ(RequestStatus::InvalidOpcode, parse(ack).status);

  std::vector<char> opcode_nine = bytes(std::string("\x00\x09" "a\0octet\0", 10));
  EXPECT_EQ(RequestStatus::InvalidOpcode, parse(opcode_nine).status);

  std::vector<char> one_byte(1, '\x01');
  EXPECT_EQ(RequestStatus::InvalidOpcode, parse(one_byte).status);
}

TEST(RequestParse, MissingModeIsMalformed) {
  std::vector<char> no_mode = bytes(std::string("\x00\x01" "a.txt\0", 8));
  EXPECT_EQ(RequestStatus::Malformed, parse(no_mode).status);

  std::vector<char> empty_mode = bytes(std::string("\x00\x01" "a.txt\0\0", 9));
  EXPECT_EQ(RequestStatus::Malformed, parse(empty_mode).status);
}

TEST(RequestParse, UnterminatedFieldsAreMalformed) {
  std::vector<char> no_nul = bytes(std::string("\x00\x01" "a.txt", 7));
  EXPECT_EQ(RequestStatus::Malformed, parse(no_nul).status);

  std::vector<char> mode_unterminated =
      bytes(std::string("\x00\x02" "a.txt\0octet", 13));
  EXPECT_EQ(RequestStatus::Malformed, parse(mode_unterminated).status);
}

TEST(RequestParse, EmptyFilenameIsMalformed) {
  std::vector<char> packet = bytes(std::string("\x00\x01\0octet\0", 9));
  EXPECT_EQ(RequestStatus::Malformed, parse(packet).status);
}

TEST(RequestParse, OnlyReceivedLengthIsScanned) {
  // The terminator after the mode sits past the datagram length
  std::vector<char> buffer = create_rrq_packet("a.txt");
  ParsedRequest request = parse_request_packet(buffer.data(), buffer.size() - 1);
  EXPECT_EQ(RequestStatus::Malformed, request.status);
}

TEST(RequestParse, TrailingOptionsAreIgnored) {
  std::vector<char> packet = create_rrq_packet("a.txt");
  const std::string option("blksize\0" "1024\0", 13);
  packet.insert(packet.end(), option.begin(), option.end());
  ParsedRequest request = parse(packet);
  ASSERT_TRUE(request.ok());
  EXPECT_EQ("a.txt", request.filename);
}

// ======================================================================
// DATA / ACK / ERROR parsing
// ======================================================================

TEST(PacketParse, Data) {
  std::vector<char> payload(100, 'q');
  std::vector<char> packet = create_data_packet(65535, payload.data(), payload.size());

  uint16_t block_num = 0;
  const char *data_ptr = nullptr;
  size_t data_size = 0;
  ASSERT_TRUE(parse_data_packet(packet.data(), packet.size(), block_num,
                                data_ptr, data_size));
  EXPECT_EQ(65535, block_num);
  EXPECT_EQ(100U, data_size);
  EXPECT_EQ(packet.data() + DATA_HEADER_SIZE, data_ptr);
}

TEST(PacketParse, DataRejectsShortOrWrongOpcode) {
  uint16_t block_num;
  const char *data_ptr;
  size_t data_size;
  std::vector<char> header_only = create_data_packet(1, nullptr, 0);
  EXPECT_FALSE(parse_data_packet(header_only.data(), 3, block_num, data_ptr,
                                 data_size));

  std::vector<char> ack = create_ack_packet(1);
  EXPECT_FALSE(parse_data_packet(ack.data(), ack.size(), block_num, data_ptr,
                                 data_size));
}

TEST(PacketParse, AckRequiresExactLength) {
  std::vector<char> ack = create_ack_packet(42);
  uint16_t block_num = 0;
  ASSERT_TRUE(parse_ack_packet(ack.data(), ack.size(), block_num));
  EXPECT_EQ(42, block_num);

  ack.push_back('\0');
  EXPECT_FALSE(parse_ack_packet(ack.data(), ack.size(), block_num));
  EXPECT_FALSE(parse_ack_packet(ack.data(), 3, block_num));
}

TEST(PacketParse, Error) {
  std::vector<char> packet = create_error_packet(1, "File not found");
  uint16_t code = 0;
  std::string message;
  ASSERT_TRUE(parse_error_packet(packet.data(), packet.size(), code, message));
  EXPECT_EQ(1, code);
  EXPECT_EQ("File not found", message);
}

TEST(PacketParse, ErrorWithoutTerminatorKeepsReceivedText) {
  std::vector<char> packet = create_error_packet(0, "abort");
  packet.pop_back();
  uint16_t code = 99;
  std::string message;
  ASSERT_TRUE(parse_error_packet(packet.data(), packet.size(), code, message));
  EXPECT_EQ(0, code);
  EXPECT_EQ("abort", message);
}

TEST(PacketParse, OpcodeOfShortDatagramIsZero) {
  const char one = 0x03;
  EXPECT_EQ(0, get_opcode(&one, 1));
  EXPECT_EQ(0, get_opcode(nullptr, 0));
}
