#include "tftpd/validation.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>

#ifdef _WIN32
#include <io.h>
#include <sys/stat.h>
#define access _access
#define R_OK 4
#define W_OK 2
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace tftpd {

namespace {

ValidationResult fail(TransferStatus status, const char *message) {
  ValidationResult result;
  result.status = status;
  result.message = message;
  return result;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ValidationResult check_filename(const std::string &filename) {
  if (filename.empty() || filename.find("..") != std::string::npos ||
      filename.find('/') != std::string::npos ||
      filename.find('\\') != std::string::npos) {
    return fail(TransferStatus::AccessDenied, "Invalid filename characters");
  }
  return ValidationResult();
}

bool has_allowed_extension(const std::string &filename,
                           const std::vector<std::string> &allowed) {
  for (const std::string &extension : allowed) {
    if (ends_with(filename, extension))
      return true;
  }
  return false;
}

ValidationResult check_download_source(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return fail(TransferStatus::NotFound, "File not found");
  }
  if (!fs::is_regular_file(path, ec) || access(path.string().c_str(), R_OK) != 0) {
    return fail(TransferStatus::AccessDenied, "Access violation");
  }
  return ValidationResult();
}

ValidationResult check_upload_target(const fs::path &write_root,
                                     const std::string &filename,
                                     const std::vector<std::string> &allowed) {
  if (!has_allowed_extension(filename, allowed)) {
    return fail(TransferStatus::InvalidExtension, "Invalid file type");
  }

  std::error_code ec;
  if (fs::exists(write_root / filename, ec)) {
    return fail(TransferStatus::AlreadyExists, "File already exists");
  }

  if (!fs::is_directory(write_root, ec) ||
      access(write_root.string().c_str(), W_OK) != 0) {
    return fail(TransferStatus::AccessDenied,
                "Access violation: Cannot write to directory");
  }
  return ValidationResult();
}

ValidationResult create_exclusive(const fs::path &path) {
#ifdef _WIN32
  int fd = _open(path.string().c_str(),
                 _O_WRONLY | _O_CREAT | _O_EXCL | _O_BINARY,
                 _S_IREAD | _S_IWRITE);
#else
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
#endif
  if (fd < 0) {
    if (errno == EEXIST) {
      return fail(TransferStatus::AlreadyExists, "File already exists");
    }
    return fail(TransferStatus::AccessDenied, "Access violation");
  }
#ifdef _WIN32
  _close(fd);
#else
  ::close(fd);
#endif
  return ValidationResult();
}

} // namespace tftpd
