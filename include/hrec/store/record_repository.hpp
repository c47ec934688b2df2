#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"

namespace hrec::store {

// Visit fields that keep an input history
enum class HistoryField {
  kHospital,
  kDepartment,
  kDoctor,
  kOrganSystem
};

std::string_view historyFieldToString(HistoryField field);
std::optional<HistoryField> historyFieldFromString(const std::string& name);

struct VisitFilter {
  std::optional<std::string> since;     // Inclusive, YYYY-MM-DD
  std::optional<std::string> until;     // Inclusive, YYYY-MM-DD
  std::optional<std::string> hospital;  // Exact match
  std::optional<std::size_t> limit;
};

// Disagreements between attachment rows and the archive
struct OrphanReport {
  std::vector<std::string> orphaned_files;                  // On disk, no row
  std::vector<hrec::core::AttachmentRecord> missing_files;  // Row, no file

  bool clean() const { return orphaned_files.empty() && missing_files.empty(); }
};

// Persistence of one user's visit records and attachment records. Attachment
// creation and deletion drive the AttachmentStore so that rows and managed
// files stay paired.
class RecordRepository {
 public:
  virtual ~RecordRepository() = default;

  virtual Result<void> initialize() = 0;

  virtual const std::string& user() const = 0;

  // Visit records
  virtual Result<hrec::core::VisitRecord> createVisit(const hrec::core::VisitRecord& visit) = 0;
  virtual Result<hrec::core::VisitRecord> updateVisit(const hrec::core::VisitRecord& visit) = 0;
  virtual Result<hrec::core::VisitRecord> getVisit(hrec::core::VisitRecordId id) = 0;
  virtual Result<std::vector<hrec::core::VisitRecord>> listVisits(const VisitFilter& filter) = 0;

  // Removes the visit, its attachment rows and their managed files
  virtual Result<void> deleteVisit(hrec::core::VisitRecordId id) = 0;

  // Attachments
  virtual Result<hrec::core::AttachmentRecord> createAttachment(
      hrec::core::VisitRecordId visit_record_id,
      const std::filesystem::path& source_file) = 0;
  virtual Result<void> deleteAttachment(hrec::core::AttachmentId id) = 0;
  virtual Result<hrec::core::AttachmentRecord> replaceAttachment(
      hrec::core::AttachmentId id,
      const std::filesystem::path& new_source) = 0;
  virtual Result<hrec::core::AttachmentRecord> getAttachment(hrec::core::AttachmentId id) = 0;
  virtual Result<std::vector<hrec::core::AttachmentRecord>> listAttachments(
      hrec::core::VisitRecordId visit_record_id) = 0;
  virtual Result<std::vector<hrec::core::AttachmentRecord>> listAllAttachments() = 0;

  // Input history, most recently updated first
  virtual Result<std::vector<std::string>> fieldHistory(HistoryField field,
                                                        std::size_t limit = 5) = 0;
  virtual Result<std::vector<std::string>> doctorsByHospital(const std::string& hospital,
                                                             std::size_t limit = 5) = 0;

  // Maintenance
  virtual Result<OrphanReport> findOrphans() = 0;
  virtual Result<std::size_t> removeOrphanedFiles() = 0;
};

}  // namespace hrec::store
