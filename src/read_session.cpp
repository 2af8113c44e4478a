#include "tftpd/session.hpp"
#include "tftpd/log.hpp"
#include "tftpd/transfer.hpp"
#include "tftpd/validation.hpp"

#include <fstream>

namespace tftpd {

ReadSession::ReadSession(Transport &transport, const ServerConfig &config,
                         const std::string &filename)
    : transport_(transport), config_(config), filename_(filename),
      path_(config.read_root / filename), block_(0), bytes_sent_(0) {}

void ReadSession::run() {
  TFTPD_LOG_INFO("Handling RRQ for " << filename_);

  ValidationResult check = check_filename(filename_);
  if (check.ok())
    check = check_download_source(path_);
  if (!check.ok()) {
    throw TransferError(check.status, check.message);
  }

  std::ifstream input_file(path_, std::ios::binary);
  if (!input_file) {
    throw TransferError(TransferStatus::AccessDenied, "Access violation");
  }

  char data_buffer[MAX_DATA_SIZE];
  size_t bytes_read;

  do {
    input_file.read(data_buffer, MAX_DATA_SIZE);
    if (input_file.bad()) {
      throw TransferError(TransferStatus::AccessDenied, "Access violation");
    }
    bytes_read = static_cast<size_t>(input_file.gcount());

    ++block_; // wraps to 0 after 65535
    send_block(data_buffer, bytes_read);
    bytes_sent_ += bytes_read;

  } while (bytes_read == MAX_DATA_SIZE); // a short block ends the transfer

  TFTPD_LOG_INFO("RRQ for " << filename_ << " completed successfully ("
                            << bytes_sent_ << " bytes).");
}

void ReadSession::send_block(const char *data, size_t size) {
  std::vector<char> data_packet = create_data_packet(block_, data, size);
  TFTPD_LOG_DEBUG("Sending DATA block " << block_ << " (" << size
                                        << " bytes)");

  ExchangeResult result = exchange(transport_, data_packet, expect_ack(block_),
                                   config_.max_retries, config_.timeout);
  switch (result.status) {
  case ExchangeStatus::Accepted:
    return;
  case ExchangeStatus::PeerError: {
    uint16_t error_code = 0;
    std::string error_msg;
    parse_error_packet(result.packet.data(), result.packet.size(), error_code,
                       error_msg);
    throw TransferError(TransferStatus::PeerAborted,
                        "Client aborted RRQ: code " +
                            std::to_string(error_code) + ": " + error_msg);
  }
  case ExchangeStatus::Illegal:
    throw TransferError(TransferStatus::IllegalOperation,
                        "Illegal TFTP operation");
  case ExchangeStatus::Exhausted:
    break;
  }
  TFTPD_LOG_WARN("Max retries exceeded waiting for ACK " << block_);
  throw TransferError(TransferStatus::Timeout, "Timeout waiting for ACK");
}

} // namespace tftpd
