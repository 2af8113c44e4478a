#ifndef TFTPD_PACKET_HPP
#define TFTPD_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tftpd/tftp_common.hpp"

namespace tftpd {

// --- Packet Creation Functions ---

std::vector<char> create_rrq_packet(const std::string &filename,
                                    const std::string &mode = "octet");
std::vector<char> create_wrq_packet(const std::string &filename,
                                    const std::string &mode = "octet");
// Throws std::length_error if data_size exceeds MAX_DATA_SIZE.
std::vector<char> create_data_packet(uint16_t block_num, const char *data,
                                     size_t data_size);
std::vector<char> create_ack_packet(uint16_t block_num);
std::vector<char> create_error_packet(uint16_t error_code,
                                      const std::string &error_msg);

// --- Packet Parsing Functions ---
// All parsers look at exactly `size` bytes and never past them.

// Returns 0 when the datagram is too short to carry an opcode.
uint16_t get_opcode(const char *buffer, size_t size);

bool parse_ack_packet(const char *buffer, size_t size, uint16_t &block_num);

// data_ptr points into buffer; it is only valid while buffer is.
bool parse_data_packet(const char *buffer, size_t size, uint16_t &block_num,
                       const char *&data_ptr, size_t &data_size);

bool parse_error_packet(const char *buffer, size_t size, uint16_t &error_code,
                        std::string &error_msg);

enum class RequestStatus {
  Ok,
  InvalidOpcode, // not RRQ or WRQ
  Malformed,     // filename or mode missing / unterminated
  InvalidMode,   // mode is not "octet"
};

struct ParsedRequest {
  RequestStatus status = RequestStatus::Malformed;
  uint16_t opcode = 0;
  std::string filename;
  std::string mode;

  bool ok() const { return status == RequestStatus::Ok; }
  bool is_read() const { return ok() && opcode == TFTP_OPCODE_RRQ; }
  bool is_write() const { return ok() && opcode == TFTP_OPCODE_WRQ; }
};

// Parses RRQ or WRQ
ParsedRequest parse_request_packet(const char *buffer, size_t size);

const char *to_string(RequestStatus status);

} // namespace tftpd

#endif // TFTPD_PACKET_HPP
