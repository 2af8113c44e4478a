#include "tftpd/session.hpp"
#include "tftpd/log.hpp"
#include "tftpd/transfer.hpp"
#include "tftpd/validation.hpp"

#include <fstream>

namespace tftpd {

WriteSession::WriteSession(Transport &transport, const ServerConfig &config,
                           const std::string &filename)
    : transport_(transport), config_(config), filename_(filename),
      path_(config.write_root / filename), expected_block_(1),
      bytes_written_(0) {}

void WriteSession::run() {
  TFTPD_LOG_INFO("Handling WRQ for " << filename_);

  ValidationResult check = check_filename(filename_);
  if (check.ok())
    check = check_upload_target(config_.write_root, filename_,
                                config_.allowed_extensions);
  if (check.ok())
    check = create_exclusive(path_);
  if (!check.ok()) {
    throw TransferError(check.status, check.message);
  }

  std::ofstream output_file(path_, std::ios::binary);
  if (!output_file) {
    throw TransferError(TransferStatus::AccessDenied, "Access violation");
  }

  // ACK 0 authorises the client to send block 1
  transport_.send(create_ack_packet(0));
  TFTPD_LOG_DEBUG("Sent initial ACK for WRQ: block 0");

  bool transfer_complete = false;
  while (!transfer_complete) {
    ExchangeResult result =
        exchange(transport_, std::vector<char>(), expect_data(), 1,
                 config_.timeout);
    if (result.status == ExchangeStatus::Exhausted) {
      throw TransferError(TransferStatus::Timeout, "Timeout waiting for data");
    }
    if (result.status == ExchangeStatus::PeerError) {
      uint16_t error_code = 0;
      std::string error_msg;
      parse_error_packet(result.packet.data(), result.packet.size(),
                         error_code, error_msg);
      throw TransferError(TransferStatus::PeerAborted,
                          "Client aborted WRQ: code " +
                              std::to_string(error_code) + ": " + error_msg);
    }
    if (result.status == ExchangeStatus::Illegal) {
      throw TransferError(TransferStatus::IllegalOperation,
                          "Illegal TFTP operation");
    }

    uint16_t block_num;
    const char *data_ptr;
    size_t data_size;
    if (!parse_data_packet(result.packet.data(), result.packet.size(),
                           block_num, data_ptr, data_size)) {
      throw TransferError(TransferStatus::IllegalOperation,
                          "Illegal TFTP operation");
    }

    uint16_t ack_block;
    if (block_num == expected_block_) {
      if (exceeds_size_limit(bytes_written_ + data_size,
                             config_.max_upload_size)) {
        throw TransferError(TransferStatus::SizeLimitExceeded,
                            "File exceeds size limit");
      }
      output_file.write(data_ptr, data_size);
      output_file.flush();
      if (!output_file) {
        throw TransferError(TransferStatus::AccessDenied, "Access violation");
      }
      bytes_written_ += data_size;
      ack_block = block_num;
      ++expected_block_; // wraps to 0 after 65535
      transfer_complete = data_size < MAX_DATA_SIZE;
      TFTPD_LOG_DEBUG("Wrote DATA block " << block_num << " (" << data_size
                                          << " bytes)");
    } else {
      // Out of sequence: drop the payload and repeat the last good ACK
      ack_block = static_cast<uint16_t>(expected_block_ - 1);
      TFTPD_LOG_DEBUG("Received unexpected block " << block_num
                                                   << ", expected "
                                                   << expected_block_);
    }

    transport_.send(create_ack_packet(ack_block));
  }

  TFTPD_LOG_INFO("WRQ for " << filename_ << " completed successfully ("
                            << bytes_written_ << " bytes).");
}

} // namespace tftpd
