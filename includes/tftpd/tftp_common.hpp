#ifndef TFTPD_TFTP_COMMON_HPP
#define TFTPD_TFTP_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
using socklen_t = int;
#else // Linux/macOS
#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
using SOCKET = int;
const int INVALID_SOCKET = -1;
const int SOCKET_ERROR = -1;
#define closesocket close
#endif

namespace tftpd {

// TFTP Opcodes
const uint16_t TFTP_OPCODE_RRQ = 1;
const uint16_t TFTP_OPCODE_WRQ = 2;
const uint16_t TFTP_OPCODE_DATA = 3;
const uint16_t TFTP_OPCODE_ACK = 4;
const uint16_t TFTP_OPCODE_ERROR = 5;

// TFTP Error Codes (only the ones this server emits)
const uint16_t TFTP_ERROR_NOT_DEFINED = 0;
const uint16_t TFTP_ERROR_FILE_NOT_FOUND = 1;
const uint16_t TFTP_ERROR_ACCESS_VIOLATION = 2;
const uint16_t TFTP_ERROR_ILLEGAL_OPERATION = 4;
const uint16_t TFTP_ERROR_FILE_ALREADY_EXISTS = 6;

// Constants
const int TFTP_DEFAULT_PORT = 69;
const size_t MAX_PACKET_SIZE = 516; // 4 byte header + 512 data
const size_t DATA_HEADER_SIZE = 4;
const size_t MAX_DATA_SIZE = 512;
const size_t ACK_PACKET_SIZE = 4;
const size_t ERROR_HEADER_SIZE = 4;
const int DEFAULT_TIMEOUT_MS = 2000;
const int DEFAULT_MAX_RETRIES = 5;
const uint64_t DEFAULT_MAX_UPLOAD_SIZE = 10 * 1024 * 1024;

// Helper structure for network initialization/cleanup
struct NetworkInitializer {
  NetworkInitializer() {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
      throw std::runtime_error("WSAStartup failed");
    }
#endif
  }
  ~NetworkInitializer() {
#ifdef _WIN32
    WSACleanup();
#endif
  }
  NetworkInitializer(const NetworkInitializer &) = delete;
  NetworkInitializer &operator=(const NetworkInitializer &) = delete;
};

// Last socket error as errno-style value
inline int last_socket_error() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

inline bool is_timeout_error(int error) {
#ifdef _WIN32
  return error == WSAETIMEDOUT || error == WSAEWOULDBLOCK;
#else
  return error == EAGAIN || error == EWOULDBLOCK;
#endif
}

} // namespace tftpd

#endif // TFTPD_TFTP_COMMON_HPP
