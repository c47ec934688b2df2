#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "hrec/store/attachment_store.hpp"
#include "hrec/store/record_repository.hpp"
#include "hrec/store/sqlite_record_repository.hpp"

namespace hrec::store {

// Per-user record databases "{data_dir}/{user}.sqlite"
class UserDirectory {
 public:
  UserDirectory(std::filesystem::path data_dir, AttachmentStore& store);
  UserDirectory(std::filesystem::path data_dir, AttachmentStore& store, DatabaseOptions options);

  // Sorted user names
  Result<std::vector<std::string>> listUsers() const;

  Result<void> createUser(const std::string& name);

  // Delete the user's database and, when requested, their attachment archive
  Result<void> deleteUser(const std::string& name, bool remove_archive = true);

  bool exists(const std::string& name) const;

  // Open an initialized repository for an existing user
  Result<std::unique_ptr<RecordRepository>> open(const std::string& name);

  std::filesystem::path databasePath(const std::string& name) const;

  const std::filesystem::path& dataDir() const { return data_dir_; }

 private:
  std::filesystem::path data_dir_;
  AttachmentStore& store_;
  DatabaseOptions options_;
};

}  // namespace hrec::store
