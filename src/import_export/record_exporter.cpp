#include "hrec/import_export/exporter.hpp"

#include "hrec/util/filesystem.hpp"
#include "hrec/util/time.hpp"

namespace hrec::import_export {

Result<std::filesystem::path> RecordExporter::exportJson(
    const std::string& user,
    const std::vector<hrec::core::VisitRecord>& records,
    const AttachmentsByVisit& attachments,
    const std::filesystem::path& output_path) const {
  nlohmann::json export_data;
  export_data["export_info"] = {
    {"format", kFormatName},
    {"version", kFormatVersion},
    {"exported_at", hrec::util::Time::toRfc3339(hrec::util::Time::now())},
    {"user", user},
    {"record_count", records.size()}
  };

  static const std::vector<hrec::core::AttachmentRecord> kNoAttachments;

  nlohmann::json records_array = nlohmann::json::array();
  for (const auto& record : records) {
    auto it = attachments.find(record.id);
    records_array.push_back(visitToJson(record, it != attachments.end() ? it->second
                                                                         : kNoAttachments));
  }
  export_data["records"] = records_array;

  std::filesystem::path output_file = output_path;
  std::error_code ec;
  if (std::filesystem::is_directory(output_file, ec)) {
    output_file = output_file / (user + "_records.json");
  }

  auto parent_dir = output_file.parent_path();
  if (!parent_dir.empty()) {
    auto dir_result = hrec::util::FileSystem::createDirectories(parent_dir);
    if (!dir_result.has_value()) {
      return std::unexpected(dir_result.error());
    }
  }

  auto write_result = hrec::util::FileSystem::writeFileAtomic(output_file, export_data.dump(2));
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Failed to write JSON file: " + write_result.error().message()));
  }

  return output_file;
}

nlohmann::json RecordExporter::visitToJson(
    const hrec::core::VisitRecord& visit,
    const std::vector<hrec::core::AttachmentRecord>& attachments) const {
  nlohmann::json visit_json = {
    {"id", visit.id},
    {"date", visit.date},
    {"hospital", visit.hospital},
    {"department", visit.department},
    {"doctor", visit.doctor},
    {"organ_system", visit.organ_system},
    {"reason", visit.reason},
    {"diagnosis", visit.diagnosis},
    {"medication", visit.medication},
    {"remark", visit.remark},
    {"created_at", visit.created_at},
    {"updated_at", visit.updated_at}
  };

  nlohmann::json attachments_json = nlohmann::json::array();
  for (const auto& attachment : attachments) {
    attachments_json.push_back({
      {"id", attachment.id},
      {"name", attachment.displayName()},
      {"path", attachment.file_path}
    });
  }
  visit_json["attachments"] = attachments_json;

  return visit_json;
}

}  // namespace hrec::import_export
