#ifndef TFTPD_TRANSPORT_HPP
#define TFTPD_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "tftpd/tftp_common.hpp"

namespace tftpd {

enum class ReceiveStatus { Packet, Timeout };

// One session's datagram endpoint, already bound to its peer.
class Transport {
public:
  virtual ~Transport() = default;

  // Throws std::runtime_error when the datagram cannot be sent.
  virtual void send(const std::vector<char> &packet) = 0;

  // Waits at most `timeout` for one datagram. On Packet, `packet` holds
  // exactly the received bytes. Throws std::runtime_error on socket failure.
  virtual ReceiveStatus receive(std::vector<char> &packet,
                                std::chrono::milliseconds timeout) = 0;
};

// UDP socket on an ephemeral port, connected to a single peer so that
// datagrams from any other address are never delivered to it.
class UdpTransport : public Transport {
public:
  explicit UdpTransport(const sockaddr_in &peer);
  ~UdpTransport() override;

  UdpTransport(const UdpTransport &) = delete;
  UdpTransport &operator=(const UdpTransport &) = delete;

  void send(const std::vector<char> &packet) override;
  ReceiveStatus receive(std::vector<char> &packet,
                        std::chrono::milliseconds timeout) override;

  uint16_t local_port() const;
  const sockaddr_in &peer() const { return peer_; }

private:
  SOCKET sock_;
  sockaddr_in peer_;
};

// "a.b.c.d:port"
std::string describe_endpoint(const sockaddr_in &addr);

// Sets SO_RCVTIMEO. Logs and returns false on failure.
bool set_socket_timeout(SOCKET sock, int milliseconds);

} // namespace tftpd

#endif // TFTPD_TRANSPORT_HPP
