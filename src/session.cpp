#include "tftpd/session.hpp"
#include "tftpd/log.hpp"

#include <stdexcept>

namespace tftpd {

namespace {

// Best effort: ERROR packets are never retried or acknowledged.
void send_error(Transport &transport, TransferStatus status,
                const std::string &message) {
  try {
    transport.send(create_error_packet(to_error_code(status), message));
    TFTPD_LOG_INFO("Sent ERROR: code " << to_error_code(status) << ", message '"
                                       << message << "'");
  } catch (const std::runtime_error &e) {
    TFTPD_LOG_WARN("Could not send ERROR packet: " << e.what());
  }
}

} // namespace

TransferStatus serve_request(Transport &transport, const ServerConfig &config,
                             const ParsedRequest &request) {
  try {
    if (request.is_read()) {
      ReadSession session(transport, config, request.filename);
      session.run();
    } else if (request.is_write()) {
      WriteSession session(transport, config, request.filename);
      session.run();
    } else {
      TFTPD_LOG_WARN("Rejecting request: " << to_string(request.status)
                                           << " (opcode " << request.opcode
                                           << ")");
      throw TransferError(TransferStatus::IllegalOperation,
                          "Illegal TFTP operation");
    }
    return TransferStatus::Ok;
  } catch (const TransferError &e) {
    if (reports_to_peer(e.status())) {
      send_error(transport, e.status(), e.what());
    }
    TFTPD_LOG_WARN("Transfer of '" << request.filename << "' failed ("
                                   << to_string(e.status())
                                   << "): " << e.what());
    return e.status();
  } catch (const std::exception &e) {
    TFTPD_LOG_ERROR("Error during transfer of '" << request.filename
                                                 << "': " << e.what());
    return TransferStatus::NetworkError;
  }
}

} // namespace tftpd
