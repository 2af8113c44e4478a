#ifndef TFTPD_ERRORS_HPP
#define TFTPD_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tftpd {

// Terminal outcome of one transfer session.
enum class TransferStatus {
  Ok,
  NotFound,
  AccessDenied,
  AlreadyExists,
  InvalidExtension,
  SizeLimitExceeded,
  IllegalOperation,
  Timeout,
  PeerAborted,  // peer sent ERROR; nothing is sent back
  NetworkError, // session socket failed; nothing can be sent back
};

const char *to_string(TransferStatus status);

// TFTP error code carried in the ERROR packet for this status.
uint16_t to_error_code(TransferStatus status);

// Whether the peer is told about this outcome with an ERROR packet.
bool reports_to_peer(TransferStatus status);

// Thrown by sessions for every terminal failure. what() is the
// message placed in the ERROR packet.
class TransferError : public std::runtime_error {
public:
  TransferError(TransferStatus status, const std::string &message)
      : std::runtime_error(message), status_(status) {}

  TransferStatus status() const { return status_; }

private:
  TransferStatus status_;
};

} // namespace tftpd

#endif // TFTPD_ERRORS_HPP
