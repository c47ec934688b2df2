#include "hrec/util/filesystem.hpp"

#include <array>
#include <fstream>
#include <random>

#ifdef _WIN32
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace hrec::util {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;
constexpr const char* kTempPrefix = ".hrec.tmp.";

}  // namespace

// AtomicFileWriter implementation
AtomicFileWriter::AtomicFileWriter(const std::filesystem::path& target_path)
    : target_path_(target_path), committed_(false) {
  // Generate unique temporary filename
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  // Fixed-length name so that any target the filesystem accepts can be staged
  temp_path_ = target_path_.parent_path() / (kTempPrefix + std::to_string(dis(gen)));
}

AtomicFileWriter::~AtomicFileWriter() {
  if (!committed_) {
    cleanup();
  }
}

bool AtomicFileWriter::isTempName(const std::string& filename) {
  return filename.starts_with(kTempPrefix);
}

Result<void> AtomicFileWriter::write(const std::string& content) {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  std::ofstream file(temp_path_, std::ios::binary);
  if (!file) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  file.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write to temporary file"));
  }

  file.close();
  if (!file) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::copyFrom(const std::filesystem::path& source) {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Writer already used"));
  }

  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open source file: " + source.string()));
  }

  std::ofstream out(temp_path_, std::ios::binary);
  if (!out) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot create temporary file: " + temp_path_.string()));
  }

  std::array<char, kCopyBufferSize> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = in.gcount();
    if (count > 0) {
      out.write(buffer.data(), count);
      if (!out) {
        out.close();
        cleanup();
        return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                         "Failed to write to temporary file: " + temp_path_.string()));
      }
    }
  }

  if (in.bad()) {
    out.close();
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Failed to read source file: " + source.string()));
  }

  out.close();
  if (!out) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to close temporary file"));
  }

  return {};
}

Result<void> AtomicFileWriter::commit() {
  if (committed_) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Already committed"));
  }

  // Ensure parent directory exists
  auto parent = target_path_.parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      cleanup();
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  // Sync the temporary file
#ifdef _WIN32
  int fd = _open(temp_path_.string().c_str(), _O_RDONLY);
  if (fd >= 0) {
    _commit(fd);
    _close(fd);
  }
#else
  int fd = open(temp_path_.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }
#endif

  // Atomic rename
  std::error_code ec;
  std::filesystem::rename(temp_path_, target_path_, ec);
  if (ec) {
    cleanup();
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Atomic rename failed: " + ec.message()));
  }

  committed_ = true;

  // Sync parent directory to ensure rename is persistent
  if (!parent.empty()) {
    auto sync_result = FileSystem::syncDirectory(parent);
    (void)sync_result;  // rename already visible; durability of the entry is best effort
  }

  return {};
}

void AtomicFileWriter::cleanup() {
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}

// FileSystem implementation
Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  AtomicFileWriter writer(path);

  auto write_result = writer.write(content);
  if (!write_result.has_value()) {
    return write_result;
  }

  return writer.commit();
}

Result<void> FileSystem::copyFileAtomic(const std::filesystem::path& from,
                                        const std::filesystem::path& to) {
  AtomicFileWriter writer(to);

  auto copy_result = writer.copyFrom(from);
  if (!copy_result.has_value()) {
    return copy_result;
  }

  return writer.commit();
}

Result<void> FileSystem::createDirectories(const std::filesystem::path& path,
                                           std::filesystem::perms perms) {
  std::error_code ec;

  bool created = std::filesystem::create_directories(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                     "Cannot create directories: " + ec.message()));
  }

  // Only tighten permissions on directories we created ourselves
  if (created) {
    std::filesystem::permissions(path, perms, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kFilePermissionDenied,
                                       "Cannot set directory permissions: " + ec.message()));
    }
  }

  return {};
}

Result<std::uintmax_t> FileSystem::fileSize(const std::filesystem::path& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot get file size: " + ec.message()));
  }

  return size;
}

Result<bool> FileSystem::removeFile(const std::filesystem::path& path) {
  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);

  if (ec) {
    auto code = ec == std::errc::permission_denied ? ErrorCode::kFilePermissionDenied
                                                   : ErrorCode::kFileWriteError;
    return std::unexpected(makeError(code, "Cannot remove file " + path.string() + ": " + ec.message()));
  }

  return removed;
}

Result<bool> FileSystem::removeTree(const std::filesystem::path& path) {
  std::error_code ec;
  auto count = std::filesystem::remove_all(path, ec);

  if (ec) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot remove directory " + path.string() + ": " + ec.message()));
  }

  return count > 0;
}

Result<std::vector<std::filesystem::path>> FileSystem::listDirectory(
    const std::filesystem::path& path, const std::string& extension_filter) {
  std::vector<std::filesystem::path> results;
  std::error_code ec;

  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kDirectoryNotFound,
                                     "Cannot list directory: " + ec.message()));
  }

  for (const auto& entry : it) {
    if (entry.is_regular_file(ec) && !ec) {
      if (extension_filter.empty() || entry.path().extension() == extension_filter) {
        results.push_back(entry.path());
      }
    }
  }

  return results;
}

Result<void> FileSystem::syncDirectory(const std::filesystem::path& path) {
#ifdef _WIN32
  (void)path;
  return {};
#else
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kFileReadError,
                                     "Cannot open directory for sync"));
  }

  auto result = fsyncFile(fd);
  close(fd);

  return result;
#endif
}

Result<void> FileSystem::fsyncFile(int fd) {
#ifdef _WIN32
  if (_commit(fd) < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Sync failed"));
  }
#else
  if (fsync(fd) < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError, "Sync failed"));
  }
#endif
  return {};
}

}  // namespace hrec::util
