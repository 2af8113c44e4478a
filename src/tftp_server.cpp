#include "tftpd/server.hpp"
#include "tftpd/log.hpp"
#include "tftpd/session.hpp"
#include "tftpd/transport.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace tftpd {

namespace {

// How often the receive loop wakes up to notice stop()
const int LISTEN_POLL_MS = 200;

// Runs on a pool worker. The transfer socket is opened here, not in the
// receive loop, so the dispatcher never waits on a transfer.
void serve_client(const ServerConfig &config, const ParsedRequest &request,
                  const sockaddr_in &client_addr) {
  try {
    UdpTransport transport(client_addr);
    TFTPD_LOG_DEBUG("Transfer socket for " << describe_endpoint(client_addr)
                                           << " on port "
                                           << transport.local_port());
    serve_request(transport, config, request);
  } catch (const std::runtime_error &e) {
    TFTPD_LOG_ERROR("Ignoring request from " << describe_endpoint(client_addr)
                                             << ": " << e.what());
  }
}

} // namespace

TFTPServer::TFTPServer(const ServerConfig &config)
    : config_(config), sock_(INVALID_SOCKET), running_(false),
      pool_(config.max_workers, config.max_pending) {}

TFTPServer::~TFTPServer() {
  stop();
  pool_.shutdown();
  if (sock_ != INVALID_SOCKET) {
    closesocket(sock_);
  }
}

void TFTPServer::start() {
  if (sock_ != INVALID_SOCKET) {
    return;
  }

  SOCKET listen_sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (listen_sock == INVALID_SOCKET) {
    throw std::runtime_error("Failed to create listening socket");
  }

  sockaddr_in server_addr{};
  server_addr.sin_family = AF_INET;
  server_addr.sin_port = htons(config_.port);
  server_addr.sin_addr.s_addr = INADDR_ANY; // Listen on all interfaces

  if (bind(listen_sock, (struct sockaddr *)&server_addr, sizeof(server_addr)) ==
      SOCKET_ERROR) {
    closesocket(listen_sock);
#ifdef _WIN32
    throw std::runtime_error("Bind failed with error: " +
                             std::to_string(WSAGetLastError()));
#else
    throw std::runtime_error("Bind failed: " + std::string(strerror(errno)));
#endif
  }

  if (!set_socket_timeout(listen_sock, LISTEN_POLL_MS)) {
    closesocket(listen_sock);
    throw std::runtime_error("Failed to set timeout on listening socket");
  }

  sock_ = listen_sock;
  running_ = true;
  TFTPD_LOG_INFO("TFTP Server listening on UDP port "
                 << port() << " (read root " << config_.read_root
                 << ", write root " << config_.write_root << ", "
                 << pool_.size() << " workers)");
}

void TFTPServer::run() {
  if (sock_ == INVALID_SOCKET) {
    throw std::logic_error("TFTPServer::run() called before start()");
  }

  char buffer[MAX_PACKET_SIZE];

  while (running_) {
    sockaddr_in client_addr{};
    socklen_t client_addr_len = sizeof(client_addr);
    int bytes_received =
        recvfrom(sock_, buffer, (int)MAX_PACKET_SIZE, 0,
                 (struct sockaddr *)&client_addr, &client_addr_len);

    if (bytes_received == SOCKET_ERROR) {
      int error = last_socket_error();
      if (is_timeout_error(error) || error == EINTR) {
        continue; // idle wake-up
      }
      TFTPD_LOG_WARN("recvfrom failed on listen socket (error "
                     << error << "). Continuing...");
      // Avoid busy-loop on error
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }

    TFTPD_LOG_INFO("Received request from " << describe_endpoint(client_addr)
                                            << " (" << bytes_received
                                            << " bytes)");
    handle_request(buffer, static_cast<size_t>(bytes_received), client_addr);
  }

  // Let queued and in-flight transfers run to completion
  pool_.shutdown();
  TFTPD_LOG_INFO("TFTP Server on port " << port() << " stopped");
}

void TFTPServer::stop() { running_ = false; }

uint16_t TFTPServer::port() const {
  if (sock_ == INVALID_SOCKET) {
    return config_.port;
  }
  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (getsockname(sock_, (struct sockaddr *)&bound, &len) == SOCKET_ERROR) {
    return config_.port;
  }
  return ntohs(bound.sin_port);
}

void TFTPServer::handle_request(const char *buffer, size_t size,
                                const sockaddr_in &client_addr) {
  ParsedRequest request = parse_request_packet(buffer, size);
  if (request.ok()) {
    TFTPD_LOG_INFO("  " << (request.is_read() ? "Read" : "Write")
                        << " request for " << request.filename
                        << " (mode " << request.mode << ")");
  } else {
    // Still handed to a worker, which answers with an ERROR
    TFTPD_LOG_WARN("Invalid request from " << describe_endpoint(client_addr)
                                           << ": " << to_string(request.status));
  }

  const ServerConfig &config = config_;
  bool accepted = pool_.try_submit([&config, request, client_addr]() {
    serve_client(config, request, client_addr);
  });
  if (!accepted) {
    TFTPD_LOG_WARN("Server busy, dropping request from "
                   << describe_endpoint(client_addr));
    send_busy(client_addr);
  }
}

void TFTPServer::send_busy(const sockaddr_in &client_addr) {
  // Best effort from the listening socket; the client may still retry
  std::vector<char> error_packet =
      create_error_packet(TFTP_ERROR_NOT_DEFINED, "Server busy");
  if (sendto(sock_, error_packet.data(), (int)error_packet.size(), 0,
             (const struct sockaddr *)&client_addr,
             sizeof(client_addr)) == SOCKET_ERROR) {
    TFTPD_LOG_WARN("Could not send busy ERROR to "
                   << describe_endpoint(client_addr) << " (error "
                   << last_socket_error() << ")");
  }
}

} // namespace tftpd
