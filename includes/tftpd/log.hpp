#ifndef TFTPD_LOG_HPP
#define TFTPD_LOG_HPP

#include <sstream>
#include <string>

namespace tftpd {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Messages below this level are dropped. Defaults to Info.
void set_log_level(LogLevel level);
LogLevel log_level();

bool log_enabled(LogLevel level);

// Info/Debug go to std::cout, Warn/Error to std::cerr. One line per call,
// lines from concurrent workers never interleave.
void log_message(LogLevel level, const std::string &message);

} // namespace tftpd

#define TFTPD_LOG(level, expr)                                                 \
  do {                                                                         \
    if (::tftpd::log_enabled(level)) {                                         \
      std::ostringstream tftpd_log_stream_;                                    \
      tftpd_log_stream_ << expr;                                               \
      ::tftpd::log_message(level, tftpd_log_stream_.str());                    \
    }                                                                          \
  } while (0)

#define TFTPD_LOG_DEBUG(expr) TFTPD_LOG(::tftpd::LogLevel::Debug, expr)
#define TFTPD_LOG_INFO(expr) TFTPD_LOG(::tftpd::LogLevel::Info, expr)
#define TFTPD_LOG_WARN(expr) TFTPD_LOG(::tftpd::LogLevel::Warn, expr)
#define TFTPD_LOG_ERROR(expr) TFTPD_LOG(::tftpd::LogLevel::Error, expr)

#endif // TFTPD_LOG_HPP
