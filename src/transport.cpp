#include "tftpd/transport.hpp"
#include "tftpd/log.hpp"

#include <cstring>
#include <stdexcept>

namespace tftpd {

namespace {

std::string socket_error_text(int error) {
#ifdef _WIN32
  return "error code " + std::to_string(error);
#else
  return strerror(error);
#endif
}

// Returns >0 when readable, 0 on timeout.
int wait_readable(SOCKET sock, int timeout_ms) {
#ifdef _WIN32
  WSAPOLLFD pfd{};
  pfd.fd = sock;
  pfd.events = POLLRDNORM;
  return WSAPoll(&pfd, 1, timeout_ms);
#else
  pollfd pfd{};
  pfd.fd = sock;
  pfd.events = POLLIN;
  int result;
  do {
    result = ::poll(&pfd, 1, timeout_ms);
  } while (result < 0 && errno == EINTR);
  return result;
#endif
}

} // namespace

bool set_socket_timeout(SOCKET sock, int milliseconds) {
#ifdef _WIN32
  DWORD timeout = milliseconds;
  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout,
                 sizeof(timeout)) == SOCKET_ERROR) {
    TFTPD_LOG_ERROR("setsockopt(SO_RCVTIMEO) failed: "
                    << socket_error_text(last_socket_error()));
    return false;
  }
#else
  struct timeval timeout;
  timeout.tv_sec = milliseconds / 1000;
  timeout.tv_usec = (milliseconds % 1000) * 1000;
  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) <
      0) {
    TFTPD_LOG_ERROR("setsockopt(SO_RCVTIMEO) failed: "
                    << socket_error_text(last_socket_error()));
    return false;
  }
#endif
  return true;
}

UdpTransport::UdpTransport(const sockaddr_in &peer)
    : sock_(INVALID_SOCKET), peer_(peer) {
  sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (sock_ == INVALID_SOCKET) {
    throw std::runtime_error("Failed to create transfer socket: " +
                             socket_error_text(last_socket_error()));
  }

  // Ephemeral local port on any interface
  sockaddr_in local{};
  local.sin_family = AF_INET;
  local.sin_port = htons(0);
  local.sin_addr.s_addr = INADDR_ANY;
  if (bind(sock_, (struct sockaddr *)&local, sizeof(local)) == SOCKET_ERROR ||
      connect(sock_, (struct sockaddr *)&peer_, sizeof(peer_)) == SOCKET_ERROR) {
    std::string reason = socket_error_text(last_socket_error());
    closesocket(sock_);
    throw std::runtime_error("Failed to open transfer socket to " +
                             describe_endpoint(peer_) + ": " + reason);
  }
}

UdpTransport::~UdpTransport() {
  if (sock_ != INVALID_SOCKET) {
    closesocket(sock_);
  }
}

void UdpTransport::send(const std::vector<char> &packet) {
  if (::send(sock_, packet.data(), (int)packet.size(), 0) == SOCKET_ERROR) {
    throw std::runtime_error("sendto " + describe_endpoint(peer_) +
                             " failed: " +
                             socket_error_text(last_socket_error()));
  }
}

ReceiveStatus UdpTransport::receive(std::vector<char> &packet,
                                    std::chrono::milliseconds timeout) {
  int ready = wait_readable(sock_, (int)timeout.count());
  if (ready == 0) {
    return ReceiveStatus::Timeout;
  }
  if (ready < 0) {
    throw std::runtime_error("poll failed: " +
                             socket_error_text(last_socket_error()));
  }

  packet.resize(MAX_PACKET_SIZE);
  int bytes_received = recv(sock_, packet.data(), (int)packet.size(), 0);
  if (bytes_received == SOCKET_ERROR) {
    int error = last_socket_error();
    if (is_timeout_error(error)) {
      packet.clear();
      return ReceiveStatus::Timeout;
    }
    throw std::runtime_error("recvfrom " + describe_endpoint(peer_) +
                             " failed: " + socket_error_text(error));
  }
  packet.resize(bytes_received);
  return ReceiveStatus::Packet;
}

uint16_t UdpTransport::local_port() const {
  sockaddr_in local{};
  socklen_t len = sizeof(local);
  if (getsockname(sock_, (struct sockaddr *)&local, &len) == SOCKET_ERROR) {
    return 0;
  }
  return ntohs(local.sin_port);
}

std::string describe_endpoint(const sockaddr_in &addr) {
  char ip[INET_ADDRSTRLEN] = "?";
  inet_ntop(AF_INET, &addr.sin_addr, ip, INET_ADDRSTRLEN);
  return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace tftpd
