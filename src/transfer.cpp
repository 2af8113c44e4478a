#include "tftpd/transfer.hpp"
#include "tftpd/log.hpp"
#include "tftpd/packet.hpp"

namespace tftpd {

ExchangeResult exchange(Transport &transport, const std::vector<char> &outbound,
                        const Classifier &classify, int max_attempts,
                        std::chrono::milliseconds timeout) {
  ExchangeResult result;
  std::vector<char> inbound;

  while (result.attempts < max_attempts) {
    ++result.attempts;
    if (!outbound.empty()) {
      transport.send(outbound);
    }

    if (transport.receive(inbound, timeout) == ReceiveStatus::Timeout) {
      TFTPD_LOG_DEBUG("Timeout waiting for reply (attempt "
                      << result.attempts << " of " << max_attempts << ")");
      continue;
    }

    Verdict verdict = classify(inbound.data(), inbound.size());
    switch (verdict) {
    case Verdict::Accept:
      result.status = ExchangeStatus::Accepted;
      result.packet.swap(inbound);
      return result;
    case Verdict::PeerError:
      result.status = ExchangeStatus::PeerError;
      result.packet.swap(inbound);
      return result;
    case Verdict::Illegal:
      result.status = ExchangeStatus::Illegal;
      result.packet.swap(inbound);
      return result;
    case Verdict::Retry:
      TFTPD_LOG_DEBUG("Unexpected reply (opcode "
                      << get_opcode(inbound.data(), inbound.size())
                      << "), attempt " << result.attempts << " of "
                      << max_attempts);
      break;
    }
  }

  result.status = ExchangeStatus::Exhausted;
  result.packet.clear();
  return result;
}

Classifier expect_ack(uint16_t block) {
  return [block](const char *buffer, size_t size) {
    uint16_t opcode = get_opcode(buffer, size);
    if (opcode == TFTP_OPCODE_ERROR) {
      return Verdict::PeerError;
    }
    uint16_t acked_block_num;
    if (parse_ack_packet(buffer, size, acked_block_num) &&
        acked_block_num == block) {
      return Verdict::Accept;
    }
    // Stale, future or malformed ACKs never advance the transfer
    return Verdict::Retry;
  };
}

Classifier expect_data() {
  return [](const char *buffer, size_t size) {
    uint16_t opcode = get_opcode(buffer, size);
    if (opcode == TFTP_OPCODE_ERROR) {
      return Verdict::PeerError;
    }
    uint16_t block_num;
    const char *data_ptr;
    size_t data_size;
    if (parse_data_packet(buffer, size, block_num, data_ptr, data_size)) {
      return Verdict::Accept;
    }
    return Verdict::Illegal;
  };
}

} // namespace tftpd
