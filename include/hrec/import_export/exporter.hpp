#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "hrec/common.hpp"
#include "hrec/core/visit_record.hpp"
#include "hrec/store/attachment_store.hpp"
#include "hrec/store/record_repository.hpp"

namespace hrec::import_export {

using AttachmentsByVisit =
    std::map<hrec::core::VisitRecordId, std::vector<hrec::core::AttachmentRecord>>;

/**
 * @brief JSON exporter - writes visit records with their attachment list
 */
class RecordExporter {
public:
  static constexpr const char* kFormatName = "hrec-records-json";
  static constexpr const char* kFormatVersion = "1.0";

  /**
   * @brief Export records to a JSON document
   * @param user Owner of the records
   * @param records Visit records to export
   * @param attachments Attachments keyed by visit record id
   * @param output_path Target file, or a directory for "{user}_records.json"
   * @return Path of the written file
   */
  Result<std::filesystem::path> exportJson(const std::string& user,
                                           const std::vector<hrec::core::VisitRecord>& records,
                                           const AttachmentsByVisit& attachments,
                                           const std::filesystem::path& output_path) const;

  /**
   * @brief Convert one visit record to JSON
   */
  nlohmann::json visitToJson(const hrec::core::VisitRecord& visit,
                             const std::vector<hrec::core::AttachmentRecord>& attachments) const;
};

struct ExportFailure {
  hrec::core::AttachmentRecord attachment;
  std::string message;
};

struct ExportSummary {
  std::vector<std::filesystem::path> copied;
  std::vector<ExportFailure> failed;
};

/**
 * @brief Copies the managed files of a set of visits into one directory
 *
 * Files are written under their display names; a name already present in
 * the directory gets "_1", "_2", ... before its extension. A file that
 * cannot be copied is reported in the summary and does not stop the export.
 */
class AttachmentBundleExporter {
public:
  Result<ExportSummary> exportBundle(hrec::store::RecordRepository& repository,
                                     hrec::store::AttachmentStore& store,
                                     const std::vector<hrec::core::VisitRecordId>& visit_ids,
                                     const std::filesystem::path& output_dir) const;

  /**
   * @brief First free "{base}{_N}{ext}" for `name` inside `dir`
   */
  static std::filesystem::path uniqueTarget(const std::filesystem::path& dir,
                                            const std::string& name);
};

}  // namespace hrec::import_export
