#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"

namespace hrec::store {

// Managed copies of attachment files, addressed by their relative path
// "{user}/{visit_record_id}_{attachment_id}_{name}" under an archive root
class AttachmentStore {
 public:
  virtual ~AttachmentStore() = default;

  // Copy `source_file` into the archive under its canonical name and return
  // the managed relative path. Nothing is left at the destination on failure.
  virtual Result<std::string> store(const std::string& user,
                                    hrec::core::VisitRecordId visit_record_id,
                                    hrec::core::AttachmentId attachment_id,
                                    const std::filesystem::path& source_file) = 0;

  // Delete a managed file; an already absent file is not an error
  virtual Result<void> remove(const std::string& relative_path) = 0;

  // Rename a managed file to a hidden sibling and return the sibling's
  // relative path, or nullopt when there is no file to move
  virtual Result<std::optional<std::string>> setAside(const std::string& relative_path) = 0;

  // Move a set-aside file back over `relative_path`
  virtual Result<void> restore(const std::string& set_aside_path,
                               const std::string& relative_path) = 0;

  // Copy a managed file to an external location
  virtual Result<void> exportTo(const std::string& relative_path,
                                const std::filesystem::path& destination) = 0;

  // Absolute location of a managed file
  virtual Result<std::filesystem::path> resolve(const std::string& relative_path) const = 0;

  virtual bool exists(const std::string& relative_path) const = 0;

  // Managed relative paths currently on disk for a user
  virtual Result<std::vector<std::string>> listUserFiles(const std::string& user) const = 0;

  // Remove every managed file of a user
  virtual Result<void> removeUserArchive(const std::string& user) = 0;
};

}  // namespace hrec::store
