#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "hrec/common.hpp"

namespace hrec::util {

// Atomic filesystem operations with safety guarantees
class AtomicFileWriter {
 public:
  explicit AtomicFileWriter(const std::filesystem::path& target_path);
  ~AtomicFileWriter();

  // Non-copyable, movable
  AtomicFileWriter(const AtomicFileWriter&) = delete;
  AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
  AtomicFileWriter(AtomicFileWriter&&) = default;
  AtomicFileWriter& operator=(AtomicFileWriter&&) = default;

  // Write content to temporary file
  Result<void> write(const std::string& content);

  // Stream the bytes of an existing file into the temporary file
  Result<void> copyFrom(const std::filesystem::path& source);

  // Commit the changes (rename temp to target)
  Result<void> commit();

  // Temporary files are hidden siblings of the target: ".hrec.tmp.<n>"
  static bool isTempName(const std::string& filename);

 private:
  std::filesystem::path target_path_;
  std::filesystem::path temp_path_;
  bool committed_;

  void cleanup();
};

// Filesystem utilities
class FileSystem {
 public:
  // Atomic write with fsync and rename
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);

  // Copy through a temporary sibling and rename into place; the target
  // either holds the complete source or is left untouched
  static Result<void> copyFileAtomic(const std::filesystem::path& from,
                                     const std::filesystem::path& to);

  // Create directory with proper permissions
  static Result<void> createDirectories(const std::filesystem::path& path,
                                        std::filesystem::perms perms = std::filesystem::perms::owner_all);

  // Get file size safely
  static Result<std::uintmax_t> fileSize(const std::filesystem::path& path);

  // Remove file; returns false when there was nothing to remove
  static Result<bool> removeFile(const std::filesystem::path& path);

  // Remove directory tree; returns false when there was nothing to remove
  static Result<bool> removeTree(const std::filesystem::path& path);

  // List regular files in a directory with optional extension filter
  static Result<std::vector<std::filesystem::path>> listDirectory(
      const std::filesystem::path& path,
      const std::string& extension_filter = "");

  // Sync directory (ensure metadata is written)
  static Result<void> syncDirectory(const std::filesystem::path& path);

 private:
  // Internal helper for fsync
  static Result<void> fsyncFile(int fd);
};

}  // namespace hrec::util
