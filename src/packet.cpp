#include "tftpd/packet.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace tftpd {

namespace {

void append_u16(std::vector<char> &packet, uint16_t value) {
  uint16_t net_value = htons(value);
  packet.insert(packet.end(), (char *)&net_value,
                (char *)&net_value + sizeof(net_value));
}

uint16_t read_u16(const char *buffer) {
  uint16_t value;
  memcpy(&value, buffer, sizeof(value));
  return ntohs(value);
}

std::vector<char> create_request_packet(uint16_t opcode,
                                        const std::string &filename,
                                        const std::string &mode) {
  std::vector<char> packet;
  packet.reserve(2 + filename.size() + 1 + mode.size() + 1);
  append_u16(packet, opcode);
  packet.insert(packet.end(), filename.begin(), filename.end());
  packet.push_back('\0');
  packet.insert(packet.end(), mode.begin(), mode.end());
  packet.push_back('\0');
  return packet;
}

bool equals_ignore_case(const std::string &lhs, const char *rhs) {
  size_t rhs_len = strlen(rhs);
  if (lhs.size() != rhs_len)
    return false;
  for (size_t i = 0; i < rhs_len; ++i) {
    if (tolower((unsigned char)lhs[i]) != tolower((unsigned char)rhs[i]))
      return false;
  }
  return true;
}

} // namespace

// --- Packet Creation Functions ---

std::vector<char> create_rrq_packet(const std::string &filename,
                                    const std::string &mode) {
  return create_request_packet(TFTP_OPCODE_RRQ, filename, mode);
}

std::vector<char> create_wrq_packet(const std::string &filename,
                                    const std::string &mode) {
  return create_request_packet(TFTP_OPCODE_WRQ, filename, mode);
}

std::vector<char> create_data_packet(uint16_t block_num, const char *data,
                                     size_t data_size) {
  if (data_size > MAX_DATA_SIZE) {
    throw std::length_error("Data size exceeds maximum allowed");
  }
  std::vector<char> packet;
  packet.reserve(DATA_HEADER_SIZE + data_size);
  append_u16(packet, TFTP_OPCODE_DATA);
  append_u16(packet, block_num);
  if (data_size > 0) {
    packet.insert(packet.end(), data, data + data_size);
  }
  return packet;
}

std::vector<char> create_ack_packet(uint16_t block_num) {
  std::vector<char> packet;
  packet.reserve(ACK_PACKET_SIZE);
  append_u16(packet, TFTP_OPCODE_ACK);
  append_u16(packet, block_num);
  return packet;
}

std::vector<char> create_error_packet(uint16_t error_code,
                                      const std::string &error_msg) {
  std::vector<char> packet;
  packet.reserve(ERROR_HEADER_SIZE + error_msg.size() + 1);
  append_u16(packet, TFTP_OPCODE_ERROR);
  append_u16(packet, error_code);
  packet.insert(packet.end(), error_msg.begin(), error_msg.end());
  packet.push_back('\0');
  return packet;
}

// --- Packet Parsing Functions ---

uint16_t get_opcode(const char *buffer, size_t size) {
  if (size < 2)
    return 0; // Invalid packet
  return read_u16(buffer);
}

bool parse_ack_packet(const char *buffer, size_t size, uint16_t &block_num) {
  if (size != ACK_PACKET_SIZE || get_opcode(buffer, size) != TFTP_OPCODE_ACK) {
    return false;
  }
  block_num = read_u16(buffer + 2);
  return true;
}

bool parse_data_packet(const char *buffer, size_t size, uint16_t &block_num,
                       const char *&data_ptr, size_t &data_size) {
  if (size < DATA_HEADER_SIZE || size > MAX_PACKET_SIZE ||
      get_opcode(buffer, size) != TFTP_OPCODE_DATA) {
    return false;
  }
  block_num = read_u16(buffer + 2);
  data_ptr = buffer + DATA_HEADER_SIZE;
  data_size = size - DATA_HEADER_SIZE;
  return true;
}

bool parse_error_packet(const char *buffer, size_t size, uint16_t &error_code,
                        std::string &error_msg) {
  if (size < ERROR_HEADER_SIZE || get_opcode(buffer, size) != TFTP_OPCODE_ERROR) {
    return false;
  }
  error_code = read_u16(buffer + 2);
  const char *msg_start = buffer + ERROR_HEADER_SIZE;
  size_t msg_space = size - ERROR_HEADER_SIZE;
  const char *msg_end = (const char *)memchr(msg_start, '\0', msg_space);
  if (msg_end == nullptr) {
    // Unterminated message: keep what the datagram carries
    msg_end = msg_start + msg_space;
  }
  error_msg.assign(msg_start, msg_end - msg_start);
  return true;
}

ParsedRequest parse_request_packet(const char *buffer, size_t size) {
  ParsedRequest request;
  request.opcode = get_opcode(buffer, size);
  if (request.opcode != TFTP_OPCODE_RRQ && request.opcode != TFTP_OPCODE_WRQ) {
    request.status = RequestStatus::InvalidOpcode;
    return request;
  }

  const char *ptr = buffer + 2;
  const char *end = buffer + size;

  // Find filename end (null terminator)
  const char *filename_end = (const char *)memchr(ptr, '\0', end - ptr);
  if (filename_end == nullptr || filename_end == ptr) {
    request.status = RequestStatus::Malformed;
    return request;
  }
  request.filename.assign(ptr, filename_end - ptr);
  ptr = filename_end + 1;

  if (ptr >= end) {
    request.status = RequestStatus::Malformed;
    return request;
  }

  // Find mode end (null terminator)
  const char *mode_end = (const char *)memchr(ptr, '\0', end - ptr);
  if (mode_end == nullptr || mode_end == ptr) {
    request.status = RequestStatus::Malformed;
    return request;
  }
  request.mode.assign(ptr, mode_end - ptr);

  // Only binary transfers are supported; anything after the mode
  // terminator (option extensions) is ignored.
  if (!equals_ignore_case(request.mode, "octet")) {
    request.status = RequestStatus::InvalidMode;
    return request;
  }

  request.status = RequestStatus::Ok;
  return request;
}

const char *to_string(RequestStatus status) {
  switch (status) {
  case RequestStatus::Ok:
    return "ok";
  case RequestStatus::InvalidOpcode:
    return "invalid opcode";
  case RequestStatus::Malformed:
    return "malformed request";
  case RequestStatus::InvalidMode:
    return "unsupported mode";
  }
  return "unknown";
}

} // namespace tftpd
