#include "hrec/store/filesystem_attachment_store.hpp"

#include <algorithm>
#include <random>

#include <spdlog/spdlog.h>

#include "hrec/util/filesystem.hpp"
#include "hrec/util/xdg.hpp"

namespace hrec::store {

namespace {

constexpr const char* kSetAsidePrefix = ".hrec.old.";

Error storeIoError(const Error& cause) {
  return makeError(ErrorCode::kStoreIoError, cause.message());
}

std::string setAsideName() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);
  return kSetAsidePrefix + std::to_string(dis(gen));
}

}  // namespace

FilesystemAttachmentStore::FilesystemAttachmentStore()
    : FilesystemAttachmentStore(Config{}, AttachmentNamer{}) {
}

FilesystemAttachmentStore::FilesystemAttachmentStore(Config config, AttachmentNamer namer)
    : config_(std::move(config)), namer_(namer) {
  if (config_.archive_root.empty()) {
    config_.archive_root = hrec::util::Xdg::archiveDir();
  }
}

Result<std::string> FilesystemAttachmentStore::store(const std::string& user,
                                                     hrec::core::VisitRecordId visit_record_id,
                                                     hrec::core::AttachmentId attachment_id,
                                                     const std::filesystem::path& source_file) {
  auto validation_result = validateSource(source_file);
  if (!validation_result.has_value()) {
    return std::unexpected(validation_result.error());
  }

  auto relative = namer_.relativePath(user, visit_record_id, attachment_id,
                                      source_file.filename().string());
  if (!relative.has_value()) {
    return std::unexpected(relative.error());
  }

  auto target = resolve(*relative);
  if (!target.has_value()) {
    return std::unexpected(target.error());
  }

  auto dir_result = ensureUserDirectory(target->parent_path());
  if (!dir_result.has_value()) {
    return std::unexpected(dir_result.error());
  }

  auto copy_result = hrec::util::FileSystem::copyFileAtomic(source_file, *target);
  if (!copy_result.has_value()) {
    auto code = copy_result.error().code();
    if (code == ErrorCode::kFileReadError || code == ErrorCode::kFileNotFound) {
      return std::unexpected(makeError(ErrorCode::kSourceNotFound, copy_result.error().message()));
    }
    return std::unexpected(storeIoError(copy_result.error()));
  }

  spdlog::debug("Stored {} as {}", source_file.string(), *relative);
  return *relative;
}

Result<void> FilesystemAttachmentStore::remove(const std::string& relative_path) {
  auto path = resolve(relative_path);
  if (!path.has_value()) {
    return std::unexpected(path.error());
  }

  auto remove_result = hrec::util::FileSystem::removeFile(*path);
  if (!remove_result.has_value()) {
    return std::unexpected(storeIoError(remove_result.error()));
  }

  if (*remove_result) {
    spdlog::debug("Removed managed file {}", relative_path);
  } else {
    spdlog::debug("Managed file {} already absent", relative_path);
  }
  return {};
}

Result<std::optional<std::string>> FilesystemAttachmentStore::setAside(
    const std::string& relative_path) {
  auto path = resolve(relative_path);
  if (!path.has_value()) {
    return std::unexpected(path.error());
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*path, ec)) {
    return std::optional<std::string>{};
  }

  auto aside =
      (std::filesystem::path(relative_path).parent_path() / setAsideName()).generic_string();
  std::filesystem::rename(*path, config_.archive_root / aside, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kStoreIoError,
                                     "Cannot move " + relative_path + " aside: " + ec.message()));
  }

  spdlog::debug("Moved {} aside to {}", relative_path, aside);
  return std::optional<std::string>(aside);
}

Result<void> FilesystemAttachmentStore::restore(const std::string& set_aside_path,
                                                const std::string& relative_path) {
  auto from = resolve(set_aside_path);
  if (!from.has_value()) {
    return std::unexpected(from.error());
  }
  auto to = resolve(relative_path);
  if (!to.has_value()) {
    return std::unexpected(to.error());
  }

  std::error_code ec;
  std::filesystem::rename(*from, *to, ec);
  if (ec) {
    return std::unexpected(makeError(ErrorCode::kStoreIoError,
                                     "Cannot restore " + relative_path + ": " + ec.message()));
  }

  spdlog::debug("Restored {} from {}", relative_path, set_aside_path);
  return {};
}

Result<void> FilesystemAttachmentStore::exportTo(const std::string& relative_path,
                                                 const std::filesystem::path& destination) {
  auto source = resolve(relative_path);
  if (!source.has_value()) {
    return std::unexpected(source.error());
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(*source, ec)) {
    return std::unexpected(makeError(ErrorCode::kSourceNotFound,
                                     "Managed file missing: " + relative_path));
  }

  auto target = destination;
  if (std::filesystem::is_directory(target, ec)) {
    auto parsed = AttachmentNamer::parse(relative_path);
    target /= parsed.has_value() ? parsed->name : source->filename().string();
  }

  auto copy_result = hrec::util::FileSystem::copyFileAtomic(*source, target);
  if (!copy_result.has_value()) {
    return std::unexpected(storeIoError(copy_result.error()));
  }

  spdlog::debug("Exported {} to {}", relative_path, target.string());
  return {};
}

Result<std::filesystem::path> FilesystemAttachmentStore::resolve(
    const std::string& relative_path) const {
  if (relative_path.empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument, "Empty attachment path"));
  }

  std::filesystem::path relative(relative_path);
  if (relative.is_absolute() || relative.has_root_name() || relative.has_root_directory()) {
    return std::unexpected(makeError(ErrorCode::kSecurityError,
                                     "Attachment path must be relative: " + relative_path));
  }

  for (const auto& part : relative) {
    if (part == "..") {
      return std::unexpected(makeError(ErrorCode::kSecurityError,
                                       "Attachment path escapes the archive: " + relative_path));
    }
  }

  return config_.archive_root / relative;
}

bool FilesystemAttachmentStore::exists(const std::string& relative_path) const {
  auto path = resolve(relative_path);
  if (!path.has_value()) {
    return false;
  }

  std::error_code ec;
  return std::filesystem::is_regular_file(*path, ec);
}

Result<std::vector<std::string>> FilesystemAttachmentStore::listUserFiles(
    const std::string& user) const {
  auto user_check = AttachmentNamer::validateUserName(user);
  if (!user_check.has_value()) {
    return std::unexpected(user_check.error());
  }

  std::vector<std::string> files;
  auto user_dir = config_.archive_root / user;

  std::error_code ec;
  if (!std::filesystem::exists(user_dir, ec)) {
    return files;
  }

  auto entries = hrec::util::FileSystem::listDirectory(user_dir);
  if (!entries.has_value()) {
    return std::unexpected(storeIoError(entries.error()));
  }

  for (const auto& entry : *entries) {
    auto name = entry.filename().string();
    if (hrec::util::AtomicFileWriter::isTempName(name)) {
      continue;
    }
    files.push_back(user + "/" + name);
  }

  std::sort(files.begin(), files.end());
  return files;
}

Result<void> FilesystemAttachmentStore::removeUserArchive(const std::string& user) {
  auto user_check = AttachmentNamer::validateUserName(user);
  if (!user_check.has_value()) {
    return std::unexpected(user_check.error());
  }

  auto removed = hrec::util::FileSystem::removeTree(config_.archive_root / user);
  if (!removed.has_value()) {
    return std::unexpected(storeIoError(removed.error()));
  }

  if (*removed) {
    spdlog::info("Removed attachment archive of user '{}'", user);
  }
  return {};
}

Result<void> FilesystemAttachmentStore::validateSource(
    const std::filesystem::path& source_file) const {
  std::error_code ec;
  if (!std::filesystem::exists(source_file, ec)) {
    return std::unexpected(makeError(ErrorCode::kSourceNotFound,
                                     "Source file not found: " + source_file.string()));
  }

  if (!std::filesystem::is_regular_file(source_file, ec)) {
    return std::unexpected(makeError(ErrorCode::kSourceNotFound,
                                     "Source is not a regular file: " + source_file.string()));
  }

  if (config_.max_file_size > 0) {
    auto size_result = hrec::util::FileSystem::fileSize(source_file);
    if (!size_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kSourceNotFound, size_result.error().message()));
    }
    if (*size_result > config_.max_file_size) {
      return std::unexpected(makeError(ErrorCode::kValidationError,
                                       "File too large: " + std::to_string(*size_result) + " bytes"));
    }
  }

  return {};
}

Result<void> FilesystemAttachmentStore::ensureUserDirectory(
    const std::filesystem::path& user_dir) const {
  std::error_code ec;
  if (std::filesystem::is_directory(user_dir, ec)) {
    return {};
  }

  if (!config_.auto_create_dirs) {
    return std::unexpected(makeError(ErrorCode::kStoreIoError,
                                     "Archive directory does not exist: " + user_dir.string()));
  }

  auto create_result = hrec::util::FileSystem::createDirectories(user_dir);
  if (!create_result.has_value()) {
    return std::unexpected(storeIoError(create_result.error()));
  }
  return {};
}

}  // namespace hrec::store
