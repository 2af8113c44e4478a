#include "tftpd/validation.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

using namespace tftpd;
using tftpd::test::TempDir;
using tftpd::test::write_file;

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kAllowed = {".txt", ".pdf", ".doc", ".docx",
                                           ".jpg", ".png", ".ul"};

} // namespace

class ValidationTest : public ::testing::Test {
protected:
  TempDir dir_;
};

TEST(FilenameCheck, AcceptsPlainNames) {
  EXPECT_TRUE(check_filename("notes.txt").ok());
  EXPECT_TRUE(check_filename("archive.tar.ul").ok());
}

TEST(FilenameCheck, RejectsPathsOutsideRoot) {
  for (const char *name : {"../secret.txt", "a/b.txt", "..", "dir\\x.txt", ""}) {
    ValidationResult result = check_filename(name);
    EXPECT_EQ(TransferStatus::AccessDenied, result.status) << name;
    EXPECT_EQ("Invalid filename characters", result.message) << name;
  }
}

TEST(ExtensionCheck, AllowList) {
  EXPECT_TRUE(has_allowed_extension("notes.txt", kAllowed));
  EXPECT_TRUE(has_allowed_extension("paper.docx", kAllowed));
  EXPECT_TRUE(has_allowed_extension("firmware.ul", kAllowed));
  EXPECT_FALSE(has_allowed_extension("payload.exe", kAllowed));
  EXPECT_FALSE(has_allowed_extension("notes.txt.exe", kAllowed));
  EXPECT_FALSE(has_allowed_extension("txt", kAllowed));
}

TEST(ExtensionCheck, IsCaseSensitive) {
  EXPECT_FALSE(has_allowed_extension("PHOTO.JPG", kAllowed));
  EXPECT_TRUE(has_allowed_extension("PHOTO.jpg", kAllowed));
}

TEST(SizeLimit, OnlyExceedingTripsTheLimit) {
  EXPECT_FALSE(exceeds_size_limit(0, 1024));
  EXPECT_FALSE(exceeds_size_limit(1024, 1024));
  EXPECT_TRUE(exceeds_size_limit(1025, 1024));
}

TEST_F(ValidationTest, DownloadSourceMissing) {
  ValidationResult result = check_download_source(dir_ / "absent.txt");
  EXPECT_EQ(TransferStatus::NotFound, result.status);
  EXPECT_EQ("File not found", result.message);
}

TEST_F(ValidationTest, DownloadSourceReadable) {
  write_file(dir_ / "hello.txt", std::vector<char>(10, 'h'));
  EXPECT_TRUE(check_download_source(dir_ / "hello.txt").ok());
}

TEST_F(ValidationTest, DownloadSourceDirectoryIsDenied) {
  fs::create_directory(dir_ / "sub");
  ValidationResult result = check_download_source(dir_ / "sub");
  EXPECT_EQ(TransferStatus::AccessDenied, result.status);
  EXPECT_EQ("Access violation", result.message);
}

TEST_F(ValidationTest, DownloadSourceUnreadableIsDenied) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "permission bits are not enforced for root";
  }
  write_file(dir_ / "locked.txt", std::vector<char>(10, 'l'));
  fs::permissions(dir_ / "locked.txt", fs::perms::none);
  EXPECT_EQ(TransferStatus::AccessDenied,
            check_download_source(dir_ / "locked.txt").status);
}

TEST_F(ValidationTest, UploadTargetAccepted) {
  EXPECT_TRUE(check_upload_target(dir_.path(), "new.txt", kAllowed).ok());
}

TEST_F(ValidationTest, UploadExtensionCheckedFirst) {
  // Extension wins even when the file exists and the root is missing
  write_file(dir_ / "payload.exe", std::vector<char>(1, 'x'));
  ValidationResult result = check_upload_target(dir_.path(), "payload.exe", kAllowed);
  EXPECT_EQ(TransferStatus::InvalidExtension, result.status);
  EXPECT_EQ("Invalid file type", result.message);

  result = check_upload_target(dir_ / "missing", "payload.exe", kAllowed);
  EXPECT_EQ(TransferStatus::InvalidExtension, result.status);
}

TEST_F(ValidationTest, UploadTargetExists) {
  write_file(dir_ / "taken.txt", std::vector<char>(1, 'x'));
  ValidationResult result = check_upload_target(dir_.path(), "taken.txt", kAllowed);
  EXPECT_EQ(TransferStatus::AlreadyExists, result.status);
  EXPECT_EQ("File already exists", result.message);
}

TEST_F(ValidationTest, UploadRootMissing) {
  ValidationResult result = check_upload_target(dir_ / "missing", "new.txt", kAllowed);
  EXPECT_EQ(TransferStatus::AccessDenied, result.status);
  EXPECT_EQ("Access violation: Cannot write to directory", result.message);
}

TEST_F(ValidationTest, UploadRootIsAFile) {
  write_file(dir_ / "plain", std::vector<char>(1, 'x'));
  EXPECT_EQ(TransferStatus::AccessDenied,
            check_upload_target(dir_ / "plain", "new.txt", kAllowed).status);
}

TEST_F(ValidationTest, UploadRootNotWritable) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "permission bits are not enforced for root";
  }
  fs::create_directory(dir_ / "ro");
  fs::permissions(dir_ / "ro", fs::perms::owner_read | fs::perms::owner_exec);
  EXPECT_EQ(TransferStatus::AccessDenied,
            check_upload_target(dir_ / "ro", "new.txt", kAllowed).status);
  fs::permissions(dir_ / "ro", fs::perms::owner_all);
}

TEST_F(ValidationTest, CreateExclusiveClaimsNameOnce) {
  EXPECT_TRUE(create_exclusive(dir_ / "claimed.txt").ok());
  ASSERT_TRUE(fs::exists(dir_ / "claimed.txt"));
  EXPECT_EQ(0U, fs::file_size(dir_ / "claimed.txt"));

  write_file(dir_ / "claimed.txt", std::vector<char>(5, 'w'));
  ValidationResult result = create_exclusive(dir_ / "claimed.txt");
  EXPECT_EQ(TransferStatus::AlreadyExists, result.status);
  EXPECT_EQ("File already exists", result.message);
  EXPECT_EQ(5U, fs::file_size(dir_ / "claimed.txt"));
}

TEST_F(ValidationTest, CreateExclusiveInMissingDirectoryIsDenied) {
  ValidationResult result = create_exclusive(dir_ / "missing" / "new.txt");
  EXPECT_EQ(TransferStatus::AccessDenied, result.status);
}
