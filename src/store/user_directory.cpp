#include "hrec/store/user_directory.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "hrec/store/attachment_namer.hpp"
#include "hrec/util/filesystem.hpp"

namespace hrec::store {

namespace {

constexpr const char* kDatabaseExtension = ".sqlite";

// SQLite side files that belong to a database
constexpr const char* kDatabaseSuffixes[] = {"-wal", "-shm", "-journal"};

}  // namespace

UserDirectory::UserDirectory(std::filesystem::path data_dir, AttachmentStore& store)
    : UserDirectory(std::move(data_dir), store, DatabaseOptions{}) {
}

UserDirectory::UserDirectory(std::filesystem::path data_dir, AttachmentStore& store,
                             DatabaseOptions options)
    : data_dir_(std::move(data_dir)), store_(store), options_(std::move(options)) {
}

Result<std::vector<std::string>> UserDirectory::listUsers() const {
  std::vector<std::string> users;

  std::error_code ec;
  if (!std::filesystem::exists(data_dir_, ec)) {
    return users;
  }

  auto files = hrec::util::FileSystem::listDirectory(data_dir_, kDatabaseExtension);
  if (!files.has_value()) {
    return std::unexpected(files.error());
  }

  for (const auto& file : *files) {
    auto name = file.stem().string();
    if (AttachmentNamer::validateUserName(name).has_value()) {
      users.push_back(name);
    }
  }

  std::sort(users.begin(), users.end());
  return users;
}

Result<void> UserDirectory::createUser(const std::string& name) {
  auto name_check = AttachmentNamer::validateUserName(name);
  if (!name_check.has_value()) {
    return name_check;
  }

  if (exists(name)) {
    return std::unexpected(makeError(ErrorCode::kAlreadyExists,
                                     "User already exists: " + name));
  }

  SqliteRecordRepository repository(databasePath(name), name, store_, options_);
  auto init_result = repository.initialize();
  if (!init_result.has_value()) {
    return init_result;
  }

  spdlog::info("Created user '{}'", name);
  return {};
}

Result<void> UserDirectory::deleteUser(const std::string& name, bool remove_archive) {
  auto name_check = AttachmentNamer::validateUserName(name);
  if (!name_check.has_value()) {
    return name_check;
  }

  if (!exists(name)) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "User not found: " + name));
  }

  auto db_path = databasePath(name);
  auto remove_result = hrec::util::FileSystem::removeFile(db_path);
  if (!remove_result.has_value()) {
    return std::unexpected(remove_result.error());
  }

  for (const char* suffix : kDatabaseSuffixes) {
    auto side_file = db_path;
    side_file += suffix;
    auto side_result = hrec::util::FileSystem::removeFile(side_file);
    if (!side_result.has_value()) {
      return std::unexpected(side_result.error());
    }
  }

  if (remove_archive) {
    auto archive_result = store_.removeUserArchive(name);
    if (!archive_result.has_value()) {
      return archive_result;
    }
  }

  spdlog::info("Deleted user '{}'{}", name, remove_archive ? " and their attachments" : "");
  return {};
}

bool UserDirectory::exists(const std::string& name) const {
  if (!AttachmentNamer::validateUserName(name).has_value()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(databasePath(name), ec);
}

Result<std::unique_ptr<RecordRepository>> UserDirectory::open(const std::string& name) {
  auto name_check = AttachmentNamer::validateUserName(name);
  if (!name_check.has_value()) {
    return std::unexpected(name_check.error());
  }

  if (!exists(name)) {
    return std::unexpected(makeError(ErrorCode::kNotFound, "User not found: " + name));
  }

  auto repository = std::make_unique<SqliteRecordRepository>(databasePath(name), name,
                                                             store_, options_);
  auto init_result = repository->initialize();
  if (!init_result.has_value()) {
    return std::unexpected(init_result.error());
  }

  return std::unique_ptr<RecordRepository>(std::move(repository));
}

std::filesystem::path UserDirectory::databasePath(const std::string& name) const {
  return data_dir_ / (name + kDatabaseExtension);
}

}  // namespace hrec::store
