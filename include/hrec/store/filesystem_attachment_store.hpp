#pragma once

#include <cstdint>
#include <filesystem>

#include "hrec/store/attachment_namer.hpp"
#include "hrec/store/attachment_store.hpp"

namespace hrec::store {

// Attachment archive on the local filesystem
class FilesystemAttachmentStore : public AttachmentStore {
 public:
  struct Config {
    std::filesystem::path archive_root;  // Empty selects the XDG default
    std::uintmax_t max_file_size = 0;    // 0 = no limit
    bool auto_create_dirs = true;
  };

  FilesystemAttachmentStore();
  FilesystemAttachmentStore(Config config, AttachmentNamer namer);
  ~FilesystemAttachmentStore() override = default;

  // AttachmentStore interface
  Result<std::string> store(const std::string& user,
                            hrec::core::VisitRecordId visit_record_id,
                            hrec::core::AttachmentId attachment_id,
                            const std::filesystem::path& source_file) override;

  Result<void> remove(const std::string& relative_path) override;

  Result<std::optional<std::string>> setAside(const std::string& relative_path) override;

  Result<void> restore(const std::string& set_aside_path,
                       const std::string& relative_path) override;

  Result<void> exportTo(const std::string& relative_path,
                        const std::filesystem::path& destination) override;

  Result<std::filesystem::path> resolve(const std::string& relative_path) const override;

  bool exists(const std::string& relative_path) const override;

  Result<std::vector<std::string>> listUserFiles(const std::string& user) const override;

  Result<void> removeUserArchive(const std::string& user) override;

  const Config& config() const { return config_; }
  const AttachmentNamer& namer() const { return namer_; }

 private:
  Config config_;
  AttachmentNamer namer_;

  Result<void> validateSource(const std::filesystem::path& source_file) const;
  Result<void> ensureUserDirectory(const std::filesystem::path& user_dir) const;
};

}  // namespace hrec::store
