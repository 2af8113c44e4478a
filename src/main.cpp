#include "tftpd/config.hpp"
#include "tftpd/log.hpp"
#include "tftpd/server.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>

namespace {

tftpd::TFTPServer *g_server = nullptr;

extern "C" void handle_signal(int) {
  if (g_server != nullptr) {
    g_server->stop();
  }
}

} // namespace

// --- Main Function ---
int main(int argc, char *argv[]) {
  tftpd::ServerConfig config;
  try {
    config = tftpd::parse_command_line(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    tftpd::print_usage(std::cerr, argv[0]);
    return 2;
  }

  if (config.show_help) {
    tftpd::print_usage(std::cout, argv[0]);
    return 0;
  }
  if (config.verbose) {
    tftpd::set_log_level(tftpd::LogLevel::Debug);
  }

  try {
    tftpd::TFTPServer server(config);
    server.start();

    g_server = &server;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    server.run();
    g_server = nullptr;
  } catch (const std::exception &e) {
    g_server = nullptr;
    std::cerr << "Server failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
