#include "tftpd/errors.hpp"
#include "tftpd/tftp_common.hpp"

namespace tftpd {

const char *to_string(TransferStatus status) {
  switch (status) {
  case TransferStatus::Ok:
    return "Ok";
  case TransferStatus::NotFound:
    return "NotFound";
  case TransferStatus::AccessDenied:
    return "AccessDenied";
  case TransferStatus::AlreadyExists:
    return "AlreadyExists";
  case TransferStatus::InvalidExtension:
    return "InvalidExtension";
  case TransferStatus::SizeLimitExceeded:
    return "SizeLimitExceeded";
  case TransferStatus::IllegalOperation:
    return "IllegalOperation";
  case TransferStatus::Timeout:
    return "Timeout";
  case TransferStatus::PeerAborted:
    return "PeerAborted";
  case TransferStatus::NetworkError:
    return "NetworkError";
  }
  return "Unknown";
}

uint16_t to_error_code(TransferStatus status) {
  switch (status) {
  case TransferStatus::NotFound:
    return TFTP_ERROR_FILE_NOT_FOUND;
  case TransferStatus::AccessDenied:
    return TFTP_ERROR_ACCESS_VIOLATION;
  case TransferStatus::AlreadyExists:
    return TFTP_ERROR_FILE_ALREADY_EXISTS;
  case TransferStatus::IllegalOperation:
    return TFTP_ERROR_ILLEGAL_OPERATION;
  default:
    // Timeout, size limit and invalid type use the custom code
    return TFTP_ERROR_NOT_DEFINED;
  }
}

bool reports_to_peer(TransferStatus status) {
  return status != TransferStatus::Ok && status != TransferStatus::PeerAborted &&
         status != TransferStatus::NetworkError;
}

} // namespace tftpd
