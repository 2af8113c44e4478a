#ifndef TFTPD_SERVER_HPP
#define TFTPD_SERVER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "tftpd/config.hpp"
#include "tftpd/packet.hpp"
#include "tftpd/tftp_common.hpp"
#include "tftpd/worker_pool.hpp"

namespace tftpd {

// Request dispatcher: owns the well-known listening socket and hands every
// request to a pooled worker with its own ephemeral socket.
class TFTPServer {
public:
  explicit TFTPServer(const ServerConfig &config);
  ~TFTPServer();

  TFTPServer(const TFTPServer &) = delete;
  TFTPServer &operator=(const TFTPServer &) = delete;

  // Creates and binds the listening socket. Throws std::runtime_error.
  void start();

  // Receive loop. Returns after stop(); queued and running transfers are
  // finished before it does.
  void run();

  // May be called from any thread or a signal handler.
  void stop();

  // Bound port, useful when the configured port is 0.
  uint16_t port() const;

  const ServerConfig &config() const { return config_; }

private:
  // Handles incoming TFTP requests
  void handle_request(const char *buffer, size_t size,
                      const sockaddr_in &client_addr);
  // ERROR(0, "Server busy") for a request the pool had no room for
  void send_busy(const sockaddr_in &client_addr);

  NetworkInitializer net_init_;
  const ServerConfig config_;
  SOCKET sock_;
  std::atomic<bool> running_;
  WorkerPool pool_;
};

} // namespace tftpd

#endif // TFTPD_SERVER_HPP
