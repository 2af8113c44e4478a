#ifndef TFTPD_SESSION_HPP
#define TFTPD_SESSION_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include "tftpd/config.hpp"
#include "tftpd/errors.hpp"
#include "tftpd/packet.hpp"
#include "tftpd/transport.hpp"

namespace tftpd {

// Download (RRQ): streams a file from the read root in 512-byte blocks,
// one DATA outstanding at a time.
class ReadSession {
public:
  ReadSession(Transport &transport, const ServerConfig &config,
              const std::string &filename);

  // Returns once the final short block is acknowledged. Throws
  // TransferError on every terminal failure.
  void run();

  const std::filesystem::path &path() const { return path_; }
  uint16_t block() const { return block_; }
  uint64_t bytes_sent() const { return bytes_sent_; }

private:
  void send_block(const char *data, size_t size);

  Transport &transport_;
  const ServerConfig &config_;
  std::string filename_;
  std::filesystem::path path_;
  uint16_t block_;
  uint64_t bytes_sent_;
};

// Upload (WRQ): acknowledges inbound DATA into a new file under the write
// root until a short block arrives.
class WriteSession {
public:
  WriteSession(Transport &transport, const ServerConfig &config,
               const std::string &filename);

  // Throws TransferError on every terminal failure. A partial file is left
  // on disk when the failure happens after data was written.
  void run();

  const std::filesystem::path &path() const { return path_; }
  uint16_t expected_block() const { return expected_block_; }
  uint64_t bytes_written() const { return bytes_written_; }

private:
  Transport &transport_;
  const ServerConfig &config_;
  std::string filename_;
  std::filesystem::path path_;
  uint16_t expected_block_;
  uint64_t bytes_written_;
};

// Worker entry point: runs one parsed request to completion over its own
// transport, sends the ERROR packet for a failed session and returns the
// outcome. Never throws.
TransferStatus serve_request(Transport &transport, const ServerConfig &config,
                             const ParsedRequest &request);

} // namespace tftpd

#endif // TFTPD_SESSION_HPP
