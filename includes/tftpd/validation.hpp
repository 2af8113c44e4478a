#ifndef TFTPD_VALIDATION_HPP
#define TFTPD_VALIDATION_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "tftpd/errors.hpp"

namespace tftpd {

// Outcome of a check: status Ok, or the failure and the text for the
// ERROR packet.
struct ValidationResult {
  TransferStatus status = TransferStatus::Ok;
  std::string message;

  bool ok() const { return status == TransferStatus::Ok; }
};

// Rejects empty names, directory separators and "..", so a request can
// never address anything outside its root.
ValidationResult check_filename(const std::string &filename);

// Case-sensitive suffix match against the allow-list.
bool has_allowed_extension(const std::string &filename,
                           const std::vector<std::string> &allowed);

// NotFound when missing, AccessDenied when not a readable regular file.
ValidationResult check_download_source(const std::filesystem::path &path);

// Runs the upload checks in order: extension, existence, write root.
ValidationResult check_upload_target(const std::filesystem::path &write_root,
                                     const std::string &filename,
                                     const std::vector<std::string> &allowed);

// Creates an empty file at `path`, failing with AlreadyExists when the name
// is already taken. Of two uploads racing for one name exactly one wins.
ValidationResult create_exclusive(const std::filesystem::path &path);

// True once the cumulative upload size has gone past the ceiling.
inline bool exceeds_size_limit(uint64_t written, uint64_t limit) {
  return written > limit;
}

} // namespace tftpd

#endif // TFTPD_VALIDATION_HPP
