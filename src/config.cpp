#include "tftpd/config.hpp"

#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace tftpd {

namespace {

long long parse_number(const std::string &option, const std::string &value,
                       long long min, long long max) {
  size_t consumed = 0;
  long long number;
  try {
    number = std::stoll(value, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid value for " + option + ": '" + value +
                                "'");
  }
  if (consumed != value.size() || number < min || number > max) {
    throw std::invalid_argument("Invalid value for " + option + ": '" + value +
                                "'");
  }
  return number;
}

std::vector<std::string> parse_extensions(const std::string &value) {
  std::vector<std::string> extensions;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (item.empty())
      continue;
    if (item[0] != '.')
      item.insert(item.begin(), '.');
    extensions.push_back(item);
  }
  if (extensions.empty()) {
    throw std::invalid_argument("Extension list must not be empty");
  }
  return extensions;
}

} // namespace

ServerConfig default_config() {
  ServerConfig config;
  unsigned int cores = std::thread::hardware_concurrency();
  if (cores > 0)
    config.max_workers = cores;
  return config;
}

ServerConfig parse_command_line(int argc, const char *const argv[]) {
  ServerConfig config = default_config();

  for (int i = 1; i < argc; ++i) {
    std::string option = argv[i];
    if (option == "-h" || option == "--help") {
      config.show_help = true;
      continue;
    }
    if (option == "-v" || option == "--verbose") {
      config.verbose = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw std::invalid_argument("Missing value for " + option);
    }
    std::string value = argv[++i];

    if (option == "-p" || option == "--port") {
      config.port = static_cast<uint16_t>(parse_number(option, value, 0, 65535));
    } else if (option == "-r" || option == "--read-root") {
      config.read_root = value;
    } else if (option == "-w" || option == "--write-root") {
      config.write_root = value;
    } else if (option == "-t" || option == "--timeout-ms") {
      config.timeout = std::chrono::milliseconds(
          parse_number(option, value, 1, std::numeric_limits<int>::max()));
    } else if (option == "-n" || option == "--retries") {
      config.max_retries = static_cast<int>(parse_number(option, value, 1, 100));
    } else if (option == "-s" || option == "--max-upload") {
      config.max_upload_size = static_cast<uint64_t>(
          parse_number(option, value, 0, std::numeric_limits<long long>::max()));
    } else if (option == "-e" || option == "--extensions") {
      config.allowed_extensions = parse_extensions(value);
    } else if (option == "-j" || option == "--workers") {
      config.max_workers = static_cast<size_t>(parse_number(option, value, 1, 1024));
    } else if (option == "-q" || option == "--max-pending") {
      config.max_pending = static_cast<size_t>(parse_number(option, value, 1, 65536));
    } else {
      throw std::invalid_argument("Unknown option: " + option);
    }
  }
  return config;
}

void print_usage(std::ostream &out, const char *program) {
  out << "Usage: " << program << " [options]\n"
      << "  -p, --port N            UDP port to listen on (default 69, 0 = any)\n"
      << "  -r, --read-root DIR     directory served to downloads\n"
      << "  -w, --write-root DIR    directory receiving uploads\n"
      << "  -t, --timeout-ms N      wait per packet in milliseconds (default 2000)\n"
      << "  -n, --retries N         send attempts per DATA block (default 5)\n"
      << "  -s, --max-upload BYTES  upload size ceiling (default 10485760)\n"
      << "  -e, --extensions LIST   comma separated upload extensions\n"
      << "  -j, --workers N         concurrent transfers\n"
      << "  -q, --max-pending N     queued requests before dropping (default 64)\n"
      << "  -v, --verbose           log every block\n"
      << "  -h, --help              show this help\n";
}

} // namespace tftpd
