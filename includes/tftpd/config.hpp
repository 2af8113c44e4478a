#ifndef TFTPD_CONFIG_HPP
#define TFTPD_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "tftpd/tftp_common.hpp"

namespace tftpd {

// Server settings. Built once at startup and handed by const reference to
// the dispatcher and every worker; nothing mutates it afterwards.
struct ServerConfig {
  uint16_t port = TFTP_DEFAULT_PORT;
  std::filesystem::path read_root = "tftpdir/read";
  std::filesystem::path write_root = "tftpdir/write";
  std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
  int max_retries = DEFAULT_MAX_RETRIES;
  uint64_t max_upload_size = DEFAULT_MAX_UPLOAD_SIZE;
  std::vector<std::string> allowed_extensions = {".txt", ".pdf", ".doc",
                                                 ".docx", ".jpg", ".png",
                                                 ".ul"};
  size_t max_workers = 4;
  size_t max_pending = 64;
  bool verbose = false;
  bool show_help = false;
};

// Defaults, with max_workers taken from the hardware.
ServerConfig default_config();

// Throws std::invalid_argument on an unknown option, a missing value or a
// value out of range.
ServerConfig parse_command_line(int argc, const char *const argv[]);

void print_usage(std::ostream &out, const char *program);

} // namespace tftpd

#endif // TFTPD_CONFIG_HPP
